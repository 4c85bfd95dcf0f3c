#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads and saves run-time configuration (JSON) on the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace pfd::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to
 *        the caller.
 *
 *  * No caching: every call to `load()` re-reads the file (cheap, tiny file).
 *  * All schema validation lives in the calling layer (Settings::fromJson).
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    /// Write \p doc via temp file + rename so a crash never leaves half a file.
    void save(const nlohmann::json& doc) const;

    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

} // namespace pfd::core
