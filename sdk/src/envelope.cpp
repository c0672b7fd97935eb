#include <kruise/sdk/envelope.hpp>

#include <kruise/common/exceptions.hpp>

namespace kruise::sdk::envelope {

  std::string encode(std::string_view payload, uint8_t flags)
  {
    auto length = static_cast<uint32_t>(payload.size());

    std::string data;
    data.reserve(HEADER_SIZE + payload.size());
    data.push_back(static_cast<char>(flags));
    data.push_back(static_cast<char>((length >> 24) & 0xFF));
    data.push_back(static_cast<char>((length >> 16) & 0xFF));
    data.push_back(static_cast<char>((length >> 8) & 0xFF));
    data.push_back(static_cast<char>(length & 0xFF));
    data.append(payload);
    return data;
  }

  void Decoder::feed(std::string_view data, const message_callback_t& on_message)
  {
    _buffer.append(data);

    size_t pos = 0;
    while (_buffer.size() - pos >= HEADER_SIZE) {

      auto byte = [this, pos](size_t idx) {
        return static_cast<uint32_t>(static_cast<uint8_t>(_buffer[pos + idx]));
      };
      uint8_t flags = static_cast<uint8_t>(byte(0));
      uint32_t length = (byte(1) << 24) | (byte(2) << 16) | (byte(3) << 8) | byte(4);

      if (_buffer.size() - pos - HEADER_SIZE < length) {
        break;
      }

      if (flags & FLAG_COMPRESSED) {
        throw common::KruiseException("Compressed stream messages are not supported!");
      }

      on_message(flags, std::string_view{_buffer}.substr(pos + HEADER_SIZE, length));
      pos += HEADER_SIZE + length;
    }
    _buffer.erase(0, pos);
  }

} // namespace kruise::sdk::envelope
