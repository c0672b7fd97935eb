#ifndef KRUISE_SDK_ENVELOPE_HPP
#define KRUISE_SDK_ENVELOPE_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace kruise::sdk::envelope {

  // Every streamed Connect message is preceded by a flag byte and a big-endian length.
  constexpr size_t HEADER_SIZE = 5;

  constexpr uint8_t FLAG_COMPRESSED = 0x01;
  constexpr uint8_t FLAG_END_STREAM = 0x02;

  std::string encode(std::string_view payload, uint8_t flags = 0);

  /**
   * @brief Reassembles envelopes from a byte stream split at arbitrary positions.
   */
  struct Decoder {

    using message_callback_t = std::function<void(uint8_t flags, std::string_view payload)>;

    // Invokes the callback once for every envelope completed by this chunk.
    void feed(std::string_view data, const message_callback_t& on_message);

    // Bytes of an unfinished envelope still waiting for the rest.
    size_t pending() const
    {
      return _buffer.size();
    }

  private:
    std::string _buffer;
  };

} // namespace kruise::sdk::envelope

#endif
