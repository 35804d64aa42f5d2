#include "storage/ref_log.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <filesystem>
#include <sstream>
#include <vector>

namespace dits {

namespace fs = std::filesystem;

namespace {

void ensureParent(const std::string &path) {
  const fs::path parent = fs::path(path).parent_path();
  if (parent.empty())
    return;
  std::error_code ec;
  fs::create_directories(parent, ec);
  if (ec)
    throwIoError("cannot create directory: " + ec.message(), parent.string());
}

} // namespace

RefLog::RefLog(std::string path) : path_(std::move(path)) {
  ensureParent(path_);
  out_.open(path_, std::ios::out | std::ios::app);
  if (!out_.is_open())
    throwIoError("cannot open reference log", path_);
}

void RefLog::append(const nlohmann::json &record) {
  const std::string line = record.dump();
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << line << '\n';
  out_.flush();
  if (!out_)
    throwIoError("reference log write failed", path_);
}

void RefLog::truncate() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.close();
  out_.open(path_, std::ios::out | std::ios::trunc);
  if (!out_.is_open())
    throwIoError("cannot truncate reference log", path_);
}

size_t RefLog::replay(const std::string &path,
                      const std::function<void(const nlohmann::json &)> &apply) {
  std::ifstream in(path);
  if (!in.is_open())
    return 0;

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty())
      lines.push_back(line);
  }
  if (in.bad())
    throwIoError("failed reading reference log", path);

  size_t applied = 0;
  for (size_t i = 0; i < lines.size(); ++i) {
    nlohmann::json record =
        nlohmann::json::parse(lines[i], nullptr, /*allow_exceptions=*/false);
    if (record.is_discarded() || !record.is_object()) {
      if (i + 1 == lines.size()) {
        Logger::getInstance().log(LogLevel::WARN,
                                  "Ignoring torn record at end of " + path);
        break;
      }
      throwIntegrityError("malformed reference log record at line " +
                          std::to_string(i + 1) + " of " + path);
    }
    apply(record);
    ++applied;
  }
  return applied;
}

void writeJsonFile(const std::string &path, const nlohmann::json &doc) {
  ensureParent(path);
  const std::string tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::out | std::ios::trunc);
    if (!out.is_open())
      throwIoError("cannot open for writing", tmp);
    out << doc.dump(2);
    out.flush();
    if (!out) {
      out.close();
      std::error_code ignored;
      fs::remove(tmp, ignored);
      throwIoError("short write", tmp);
    }
  }
  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    throwIoError("rename failed: " + ec.message(), path);
  }
}

nlohmann::json readJsonFile(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    std::error_code ec;
    if (!fs::exists(path, ec))
      throw NotFoundError(path);
    throwIoError("cannot open for reading", path);
  }
  std::stringstream ss;
  ss << in.rdbuf();
  nlohmann::json doc =
      nlohmann::json::parse(ss.str(), nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded())
    throwIntegrityError("malformed JSON document " + path);
  return doc;
}

} // namespace dits
