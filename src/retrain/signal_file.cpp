#include "retrain/signal_file.hpp"
#include "core/logger.hpp"

#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace {
// Process-wide so two SignalFile objects on one path never pick the same
// private name
std::atomic<uint64_t> claim_counter{0};
} // namespace

SignalFile::SignalFile(std::string path) : path_(std::move(path)) {}

bool SignalFile::exists() const {
  std::error_code ec;
  return std::filesystem::exists(path_, ec);
}

std::optional<RetrainSignal> SignalFile::claim() {
  const std::string claimed_path =
      path_ + ".claimed." + std::to_string(::getpid()) + "." +
      std::to_string(claim_counter.fetch_add(1));

  if (std::rename(path_.c_str(), claimed_path.c_str()) != 0) {
    if (errno != ENOENT)
      LOG(LogLevel::ERROR, LogComponent::RETRAIN_MONITOR,
          "Could not claim signal file " << path_ << ": "
                                         << std::strerror(errno));
    return std::nullopt;
  }

  RetrainSignal signal;
  signal.claimed_at = std::chrono::system_clock::now();

  std::ifstream in(claimed_path);
  std::string content;
  if (in.is_open())
    content.assign(std::istreambuf_iterator<char>(in),
                   std::istreambuf_iterator<char>());
  if (in.is_open() && !in.bad()) {
    signal.payload = std::move(content);
    signal.payload_read = true;
    LOG(LogLevel::INFO, LogComponent::RETRAIN_MONITOR,
        "Signal file content: " << signal.payload);
  } else {
    signal.payload = "Unknown";
    LOG(LogLevel::ERROR, LogComponent::RETRAIN_MONITOR,
        "Error reading signal file " << claimed_path);
  }
  in.close();

  std::error_code ec;
  if (std::filesystem::remove(claimed_path, ec))
    LOG(LogLevel::INFO, LogComponent::RETRAIN_MONITOR, "Signal file removed");
  else
    LOG(LogLevel::ERROR, LogComponent::RETRAIN_MONITOR,
        "Error removing signal file " << claimed_path << ": "
                                      << ec.message());
  return signal;
}

bool SignalFile::request(const std::string &path, const std::string &reason) {
  std::error_code ec;
  auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty())
    std::filesystem::create_directories(parent, ec);

  const std::string tmp_path = path + ".tmp." + std::to_string(::getpid());
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out.is_open()) {
      LOG(LogLevel::ERROR, LogComponent::RETRAIN_MONITOR,
          "Cannot write signal file " << tmp_path);
      return false;
    }
    out << reason;
    if (!out) {
      LOG(LogLevel::ERROR, LogComponent::RETRAIN_MONITOR,
          "Short write to signal file " << tmp_path);
      return false;
    }
  }

  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    LOG(LogLevel::ERROR, LogComponent::RETRAIN_MONITOR,
        "Cannot publish signal file " << path << ": " << std::strerror(errno));
    std::filesystem::remove(tmp_path, ec);
    return false;
  }
  LOG(LogLevel::INFO, LogComponent::RETRAIN_MONITOR,
      "Retrain requested via " << path << ": " << reason);
  return true;
}
