#ifndef __ROTFTP_FILE_IO_HPP__
#define __ROTFTP_FILE_IO_HPP__
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace rotftp {
namespace fileio {

class reader {
  std::fstream handle;

public:
  reader(const std::string &filename) : handle(filename, std::ios::in | std::ios::binary) {}

  bool is_open() { return this->handle.is_open(); }

  /* Reads from disk and start filling from itr_begin till itr_end. Returns true if read went through without
   * any problem. bytes_read argument is set to number of bytes read from the file, it's less than buffer size
   * once end of file is reached.
   */
  template <typename T>
  bool fill_buffer(T itr_begin, T itr_end, std::streamsize &bytes_read) noexcept {
    bytes_read = 0;
    if (!this->is_open()) {
      return false;
    }
    size_t buffer_size = itr_end - itr_begin;
    std::unique_ptr<char[]> buffer(new char[buffer_size]);
    this->handle.read(buffer.get(), buffer_size);
    if (this->handle.bad()) {
      this->handle.close();
      return false;
    }
    bytes_read = this->handle.gcount();
    std::copy(&buffer.get()[0], &buffer.get()[0] + bytes_read, itr_begin);
    return true;
  }
};

/* Reads whole file in memory. Throws payload_exception if file can't be opened or read
 */
std::shared_ptr<const std::vector<uint8_t>> load_payload(const std::string &filename);

} // namespace fileio
} // namespace rotftp

#endif
