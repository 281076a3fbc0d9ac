#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "structwire/packet/layout.hpp"
#include "structwire/utils/config_loader.hpp"
#include "structwire/utils/log_config.hpp"

namespace structwire::inspect {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

/**
 * @brief One sample record the tool knows by name
 */
struct RecordEntry {
  std::string name;
  std::size_t size;
  std::function<packet::RecordLayout()> layout;
  std::function<nlohmann::json(std::span<const uint8_t>)> decode;
  std::function<std::vector<uint8_t>(const nlohmann::json&)> encode;
  std::function<bool(uint8_t)> matches;  // empty when the record has no identifier
};

const std::vector<RecordEntry>& registry();
const RecordEntry* find_entry(const std::string& name);

/**
 * @brief First registered record whose identifier equals first_byte
 * @return nullptr when no record matches
 */
const RecordEntry* match_identifier(uint8_t first_byte);

bool read_all(const std::filesystem::path& p, std::vector<uint8_t>& out);
bool write_all(const std::filesystem::path& p, const std::vector<uint8_t>& bytes);

/**
 * @brief Parse "00012a", "00 01 2a" or "00:01:2a"
 * @return std::nullopt on a non-hex character or an odd digit count
 */
std::optional<std::vector<uint8_t>> parse_hex(const std::string& text);

/// Lower-case hex bytes separated by single spaces
std::string to_hex(const std::vector<uint8_t>& bytes);

void print_usage(std::ostream& err);

int run_layout(const utils::ConfigLoader& cfg, std::ostream& out, std::ostream& err);
int run_decode(const utils::ConfigLoader& cfg, const std::shared_ptr<utils::Logger>& logger,
               std::ostream& out, std::ostream& err);
int run_encode(const utils::ConfigLoader& cfg, const std::shared_ptr<utils::Logger>& logger,
               std::ostream& out, std::ostream& err);

/**
 * @brief Dispatch one command and map its outcome to an exit code
 *
 * PacketError from the codec becomes kExitFailure; an unknown command is
 * a usage error.
 */
int run_command(const std::string& command, const utils::ConfigLoader& cfg,
                const std::shared_ptr<utils::Logger>& logger, std::ostream& out, std::ostream& err);

} // namespace structwire::inspect
