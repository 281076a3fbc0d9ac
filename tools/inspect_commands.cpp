#include "inspect_commands.hpp"

#include <cctype>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <system_error>

#include "structwire/packet/exceptions.hpp"
#include "structwire/packet/identifier.hpp"
#include "structwire/packet/json.hpp"
#include "structwire/packet/record.hpp"

#include "sample_records.hpp"

namespace structwire::inspect {

namespace {

template<packet::Record R>
RecordEntry make_entry(const std::string& name) {
  RecordEntry e;
  e.name = name;
  e.size = packet::byte_len_v<R>;
  e.layout = [name] { return packet::describe_layout<R>(name); };
  e.decode = [](std::span<const uint8_t> in) { return packet::record_to_json(packet::decode<R>(in)); };
  e.encode = [](const nlohmann::json& j) { return packet::encode_to_vector(packet::record_from_json<R>(j)); };
  if constexpr (packet::HasIdentifier<R>) {
    e.matches = [](uint8_t b) { return packet::matches_identifier<R>(b); };
  }
  return e;
}

} // namespace

const std::vector<RecordEntry>& registry() {
  static const std::vector<RecordEntry> entries = {
    make_entry<samples::Packet>("packet"),
    make_entry<samples::Integers>("integers"),
    make_entry<samples::Frame>("frame"),
  };
  return entries;
}

const RecordEntry* find_entry(const std::string& name) {
  for (const auto& e : registry()) {
    if (e.name == name) return &e;
  }
  return nullptr;
}

const RecordEntry* match_identifier(uint8_t first_byte) {
  for (const auto& e : registry()) {
    if (e.matches && e.matches(first_byte)) return &e;
  }
  return nullptr;
}

bool read_all(const std::filesystem::path& p, std::vector<uint8_t>& out) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(p, ec)) return false;
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return false;
  ifs.seekg(0, std::ios::end);
  auto n = ifs.tellg();
  if (n < 0) return false;
  ifs.seekg(0, std::ios::beg);
  out.resize(static_cast<size_t>(n));
  if (n > 0) ifs.read(reinterpret_cast<char*>(out.data()), n);
  return static_cast<bool>(ifs);
}

bool write_all(const std::filesystem::path& p, const std::vector<uint8_t>& bytes) {
  std::ofstream ofs(p, std::ios::binary);
  if (!ofs) return false;
  ofs.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  return static_cast<bool>(ofs);
}

std::optional<std::vector<uint8_t>> parse_hex(const std::string& text) {
  std::string digits;
  for (char c : text) {
    if (c == ' ' || c == ':' || c == '\t' || c == '\n') continue;
    if (!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
    digits += c;
  }
  if (digits.size() % 2 != 0) return std::nullopt;
  std::vector<uint8_t> out;
  out.reserve(digits.size() / 2);
  for (size_t i = 0; i < digits.size(); i += 2) {
    out.push_back(static_cast<uint8_t>(std::stoul(digits.substr(i, 2), nullptr, 16)));
  }
  return out;
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
  std::ostringstream os;
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i) os << ' ';
    os << std::hex << std::setw(2) << std::setfill('0') << int(bytes[i]);
  }
  return os.str();
}

void print_usage(std::ostream& err) {
  err << "Usage: structwire_inspect <command> [--key=value...]\n"
      << "  layout --record=<name> [--format=text|json]\n"
      << "  decode --record=<name|auto> (--hex=<bytes> | --input=<file>)\n"
      << "  encode --record=<name> --json=<file> [--output=<file>]\n"
      << "Common: --config=<file> --log.level=<level> --log.file=<file>\n"
      << "Records:";
  for (const auto& e : registry()) err << ' ' << e.name;
  err << "\n";
}

int run_layout(const utils::ConfigLoader& cfg, std::ostream& out, std::ostream& err) {
  const auto* entry = find_entry(cfg.get_string("record"));
  if (!entry) { print_usage(err); return kExitUsage; }
  auto layout = entry->layout();
  if (cfg.get_string("format", "text") == "json") {
    out << layout.to_json().dump(2) << "\n";
  } else {
    out << layout.to_string();
  }
  return kExitOk;
}

int run_decode(const utils::ConfigLoader& cfg, const std::shared_ptr<utils::Logger>& logger,
               std::ostream& out, std::ostream& err) {
  std::vector<uint8_t> bytes;
  if (cfg.has("hex")) {
    auto parsed = parse_hex(cfg.get_string("hex"));
    if (!parsed) { err << "invalid hex string\n"; return kExitUsage; }
    bytes = std::move(*parsed);
  } else if (cfg.has("input")) {
    if (!read_all(cfg.get_string("input"), bytes)) { err << "failed to read file\n"; return kExitFailure; }
  } else {
    print_usage(err);
    return kExitUsage;
  }

  const std::string record = cfg.get_string("record", "auto");
  const RecordEntry* entry = nullptr;
  if (record == "auto") {
    if (bytes.empty()) { err << "no bytes to match an identifier against\n"; return kExitFailure; }
    entry = match_identifier(bytes[0]);
    if (!entry) {
      err << "no record matches identifier " << int(bytes[0]) << "\n";
      return kExitFailure;
    }
    STRUCTWIRE_LOG_INFO(logger, "identifier " + std::to_string(bytes[0]) + " selects " + entry->name);
  } else {
    entry = find_entry(record);
    if (!entry) { print_usage(err); return kExitUsage; }
  }

  if (bytes.size() > entry->size) {
    STRUCTWIRE_LOG_WARNING(logger, std::to_string(bytes.size() - entry->size) + " trailing bytes ignored");
  }
  out << entry->decode(bytes).dump(2) << "\n";
  return kExitOk;
}

int run_encode(const utils::ConfigLoader& cfg, const std::shared_ptr<utils::Logger>& logger,
               std::ostream& out, std::ostream& err) {
  const auto* entry = find_entry(cfg.get_string("record"));
  if (!entry || !cfg.has("json")) { print_usage(err); return kExitUsage; }

  std::ifstream ifs(cfg.get_string("json"));
  if (!ifs) { err << "failed to read file\n"; return kExitFailure; }
  nlohmann::json doc = nlohmann::json::parse(ifs, nullptr, false);
  if (doc.is_discarded()) { err << "invalid JSON document\n"; return kExitFailure; }

  auto bytes = entry->encode(doc);
  if (cfg.has("output")) {
    const auto path = cfg.get_string("output");
    if (!write_all(path, bytes)) { err << "failed to write file\n"; return kExitFailure; }
    STRUCTWIRE_LOG_INFO(logger, "wrote " + std::to_string(bytes.size()) + " bytes to " + path);
  } else {
    out << to_hex(bytes) << "\n";
  }
  return kExitOk;
}

int run_command(const std::string& command, const utils::ConfigLoader& cfg,
                const std::shared_ptr<utils::Logger>& logger, std::ostream& out, std::ostream& err) {
  try {
    if (command == "layout") return run_layout(cfg, out, err);
    if (command == "decode") return run_decode(cfg, logger, out, err);
    if (command == "encode") return run_encode(cfg, logger, out, err);
  } catch (const packet::PacketError& e) {
    STRUCTWIRE_LOG_ERROR(logger, e.what());
    err << e.what() << "\n";
    return kExitFailure;
  }
  err << "unknown command: " << command << "\n";
  print_usage(err);
  return kExitUsage;
}

} // namespace structwire::inspect
