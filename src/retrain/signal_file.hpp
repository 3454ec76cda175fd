#ifndef SIGNAL_FILE_HPP
#define SIGNAL_FILE_HPP

#include <chrono>
#include <optional>
#include <string>

struct RetrainSignal {
  std::string payload; // "Unknown" when the file could not be read
  bool payload_read = false;
  std::chrono::system_clock::time_point claimed_at;
};

// The file whose presence means "a retrain has been requested".
//
// claim() renames the file to a private name before touching it, so of
// several observers racing for one creation exactly one succeeds. The claimed
// file is deleted before claim() returns, readable or not.
class SignalFile {
public:
  explicit SignalFile(std::string path);

  bool exists() const;
  std::optional<RetrainSignal> claim();

  // Creates the signal atomically (temporary file, then rename)
  static bool request(const std::string &path, const std::string &reason);

  const std::string &get_path() const { return path_; }

private:
  std::string path_;
};

#endif // SIGNAL_FILE_HPP
