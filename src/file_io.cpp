#include <array>

#include "rotftp/exception.hpp"
#include "rotftp/file_io.hpp"
#include "rotftp/log.hpp"

using namespace rotftp;

std::shared_ptr<const std::vector<uint8_t>> fileio::load_payload(const std::string &filename) {
  reader read_handle(filename);
  if (!read_handle.is_open()) {
    throw payload_exception("Failed to open " + filename);
  }
  auto payload = std::make_shared<std::vector<uint8_t>>();
  std::array<uint8_t, 4096> chunk;
  std::streamsize bytes_read = 0;
  do {
    if (!read_handle.fill_buffer(chunk.begin(), chunk.end(), bytes_read)) {
      throw payload_exception("Failed to read " + filename);
    }
    payload->insert(payload->end(), chunk.begin(), chunk.begin() + bytes_read);
  } while (bytes_read == static_cast<std::streamsize>(chunk.size()));
  DEBUG("Loaded %lu bytes from %s", payload->size(), filename.c_str());
  return payload;
}
