#ifndef RELOAD_TARGET_HPP
#define RELOAD_TARGET_HPP

// Something that can re-fetch and serve the current production version.
// Implemented in-process by ModelServer and remotely by HttpReloadClient.
class IReloadTarget {
public:
  virtual ~IReloadTarget() = default;

  // False when the served model was left unchanged because of a failure
  virtual bool reload() = 0;
};

#endif // RELOAD_TARGET_HPP
