#include <literalgrep/utf8.hpp>

bool is_valid_utf8(std::string_view data) {
  std::size_t i{0};
  const auto size = data.size();

  while (i < size) {
    const auto byte0 = static_cast<unsigned char>(data[i]);

    if (byte0 < 0x80) {
      i += 1;
      continue;
    }

    std::size_t length{0};
    unsigned char lower{0x80}, upper{0xBF};
    if (byte0 >= 0xC2 && byte0 <= 0xDF) {
      length = 2;
    } else if (byte0 >= 0xE0 && byte0 <= 0xEF) {
      length = 3;
      if (byte0 == 0xE0) {
        lower = 0xA0; // overlong
      } else if (byte0 == 0xED) {
        upper = 0x9F; // surrogates
      }
    } else if (byte0 >= 0xF0 && byte0 <= 0xF4) {
      length = 4;
      if (byte0 == 0xF0) {
        lower = 0x90; // overlong
      } else if (byte0 == 0xF4) {
        upper = 0x8F; // above U+10FFFF
      }
    } else {
      return false;
    }

    if (size - i < length) {
      return false;
    }

    const auto byte1 = static_cast<unsigned char>(data[i + 1]);
    if (byte1 < lower || byte1 > upper) {
      return false;
    }
    for (std::size_t j = 2; j < length; ++j) {
      const auto next = static_cast<unsigned char>(data[i + j]);
      if ((next & 0xC0) != 0x80) {
        return false;
      }
    }

    i += length;
  }

  return true;
}
