#ifndef HTTPNTLM_NTLM_NTLM_BUFFER_H_
#define HTTPNTLM_NTLM_NTLM_BUFFER_H_

#include <cstddef>
#include <cstdint>

#include <vector>

#include "httpntlm/ntlm/ntlm_constants.h"

namespace httpntlm {
namespace ntlm {

// Bounds checked little endian reader over an NTLM message. Every Read and
// Match method returns false without moving the cursor past the end of the
// buffer.
class NtlmBufferReader {
 public:
  explicit NtlmBufferReader(const Buffer& buffer);
  NtlmBufferReader(const uint8_t* p_data, std::size_t length);

  inline std::size_t length() const { return length_; }
  inline std::size_t cursor() const { return cursor_; }
  inline bool IsEndOfBuffer() const { return cursor_ >= length_; }

  bool CanRead(std::size_t length) const;
  bool CanReadFrom(std::size_t offset, std::size_t length) const;

  bool ReadUInt16(uint16_t* p_value);
  bool ReadUInt32(uint32_t* p_value);
  bool ReadUInt64(uint64_t* p_value);
  bool ReadBytes(uint8_t* p_data, std::size_t length);
  bool ReadSecurityBuffer(SecurityBuffer* p_security_buffer);
  // Payload of a security buffer, the cursor is not moved
  bool ReadBytesFrom(const SecurityBuffer& security_buffer, Buffer* p_bytes);
  // AV pairs up to and including the MsvAvEOL terminator
  bool ReadTargetInfo(std::vector<AvPair>* p_av_pairs);

  bool SkipBytes(std::size_t count);

  bool MatchSignature();
  bool MatchMessageType(MessageType message_type);

 private:
  template <typename T>
  bool ReadUInt(T* p_value);

 private:
  const uint8_t* p_data_;
  std::size_t length_;
  std::size_t cursor_;
};

// Fixed size little endian writer. Write methods fail if the message would
// overflow the size given at construction.
class NtlmBufferWriter {
 public:
  explicit NtlmBufferWriter(std::size_t length);

  inline std::size_t length() const { return buffer_.size(); }
  inline std::size_t cursor() const { return cursor_; }
  inline bool IsEndOfBuffer() const { return cursor_ >= buffer_.size(); }

  bool CanWrite(std::size_t length) const;

  bool WriteUInt16(uint16_t value);
  bool WriteUInt32(uint32_t value);
  bool WriteUInt64(uint64_t value);
  bool WriteBytes(const uint8_t* p_data, std::size_t length);
  bool WriteBytes(const Buffer& bytes);
  bool WriteZeros(std::size_t count);
  bool WriteSecurityBuffer(const SecurityBuffer& security_buffer);
  bool WriteAvPair(const AvPair& av_pair);
  bool WriteAvPairTerminator();
  bool WriteSignature();
  bool WriteMessageType(MessageType message_type);

  // Moves the written message out of the writer
  Buffer Pass();

 private:
  template <typename T>
  bool WriteUInt(T value);

 private:
  Buffer buffer_;
  std::size_t cursor_;
};

}  // ntlm
}  // httpntlm

#endif  // HTTPNTLM_NTLM_NTLM_BUFFER_H_
