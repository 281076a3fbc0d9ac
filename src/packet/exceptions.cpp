#include "structwire/packet/exceptions.hpp"

#include "structwire/utils/log_config.hpp"

namespace structwire::packet {

void throw_buffer_size_error(std::string_view operation, std::size_t required, std::size_t actual) {
    auto logger = utils::LogManager::instance().get_logger("structwire.packet");
    logger->log_with_metadata(utils::LogLevel::Debug, "buffer too small",
                              {{"operation", std::string(operation)},
                               {"required", std::to_string(required)},
                               {"actual", std::to_string(actual)}},
                              __FILE__, __LINE__, __FUNCTION__);
    throw BufferSizeError(operation, required, actual);
}

} // namespace structwire::packet
