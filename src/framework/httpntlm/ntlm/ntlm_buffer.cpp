#include <cstring>

#include <utility>

#include "httpntlm/ntlm/ntlm_buffer.h"

namespace httpntlm {
namespace ntlm {

NtlmBufferReader::NtlmBufferReader(const Buffer& buffer)
    : NtlmBufferReader(buffer.data(), buffer.size()) {}

NtlmBufferReader::NtlmBufferReader(const uint8_t* p_data, std::size_t length)
    : p_data_(p_data), length_(p_data == nullptr ? 0 : length), cursor_(0) {}

bool NtlmBufferReader::CanRead(std::size_t length) const {
  return CanReadFrom(cursor_, length);
}

bool NtlmBufferReader::CanReadFrom(std::size_t offset,
                                   std::size_t length) const {
  if (length == 0) {
    return true;
  }

  return length <= length_ && offset <= length_ - length;
}

bool NtlmBufferReader::ReadUInt16(uint16_t* p_value) {
  return ReadUInt<uint16_t>(p_value);
}

bool NtlmBufferReader::ReadUInt32(uint32_t* p_value) {
  return ReadUInt<uint32_t>(p_value);
}

bool NtlmBufferReader::ReadUInt64(uint64_t* p_value) {
  return ReadUInt<uint64_t>(p_value);
}

template <typename T>
bool NtlmBufferReader::ReadUInt(T* p_value) {
  if (!CanRead(sizeof(T))) {
    return false;
  }

  T value = 0;
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    value |= static_cast<T>(p_data_[cursor_ + i]) << (8 * i);
  }
  *p_value = value;
  cursor_ += sizeof(T);

  return true;
}

bool NtlmBufferReader::ReadBytes(uint8_t* p_data, std::size_t length) {
  if (!CanRead(length)) {
    return false;
  }

  if (length > 0) {
    std::memcpy(p_data, p_data_ + cursor_, length);
  }
  cursor_ += length;

  return true;
}

bool NtlmBufferReader::ReadSecurityBuffer(SecurityBuffer* p_security_buffer) {
  uint16_t length = 0;
  uint16_t max_length = 0;
  uint32_t offset = 0;
  if (!ReadUInt16(&length) || !ReadUInt16(&max_length) ||
      !ReadUInt32(&offset)) {
    return false;
  }

  p_security_buffer->length = length;
  p_security_buffer->offset = offset;

  return true;
}

bool NtlmBufferReader::ReadBytesFrom(const SecurityBuffer& security_buffer,
                                     Buffer* p_bytes) {
  if (!CanReadFrom(security_buffer.offset, security_buffer.length)) {
    return false;
  }

  p_bytes->assign(p_data_ + security_buffer.offset,
                  p_data_ + security_buffer.offset + security_buffer.length);

  return true;
}

bool NtlmBufferReader::ReadTargetInfo(std::vector<AvPair>* p_av_pairs) {
  p_av_pairs->clear();

  for (;;) {
    uint16_t avid = 0;
    uint16_t avlen = 0;
    if (!ReadUInt16(&avid) || !ReadUInt16(&avlen)) {
      return false;
    }

    if (avid == kAvEol) {
      // the terminator carries no payload
      return avlen == 0;
    }

    AvPair av_pair;
    av_pair.avid = static_cast<TargetInfoAvId>(avid);
    av_pair.buffer.resize(avlen);
    if (!ReadBytes(av_pair.buffer.data(), avlen)) {
      return false;
    }
    p_av_pairs->push_back(av_pair);
  }
}

bool NtlmBufferReader::SkipBytes(std::size_t count) {
  if (!CanRead(count)) {
    return false;
  }

  cursor_ += count;
  return true;
}

bool NtlmBufferReader::MatchSignature() {
  if (!CanRead(kSignatureLength) ||
      std::memcmp(p_data_ + cursor_, kSignature, kSignatureLength) != 0) {
    return false;
  }

  cursor_ += kSignatureLength;
  return true;
}

bool NtlmBufferReader::MatchMessageType(MessageType message_type) {
  uint32_t value = 0;
  return ReadUInt32(&value) && value == message_type;
}

NtlmBufferWriter::NtlmBufferWriter(std::size_t length)
    : buffer_(length, 0), cursor_(0) {}

bool NtlmBufferWriter::CanWrite(std::size_t length) const {
  if (length == 0) {
    return true;
  }

  return length <= buffer_.size() && cursor_ <= buffer_.size() - length;
}

bool NtlmBufferWriter::WriteUInt16(uint16_t value) {
  return WriteUInt<uint16_t>(value);
}

bool NtlmBufferWriter::WriteUInt32(uint32_t value) {
  return WriteUInt<uint32_t>(value);
}

bool NtlmBufferWriter::WriteUInt64(uint64_t value) {
  return WriteUInt<uint64_t>(value);
}

template <typename T>
bool NtlmBufferWriter::WriteUInt(T value) {
  if (!CanWrite(sizeof(T))) {
    return false;
  }

  for (std::size_t i = 0; i < sizeof(T); ++i) {
    buffer_[cursor_ + i] = static_cast<uint8_t>(value & 0xff);
    value = static_cast<T>(value >> 8);
  }
  cursor_ += sizeof(T);

  return true;
}

bool NtlmBufferWriter::WriteBytes(const uint8_t* p_data, std::size_t length) {
  if (!CanWrite(length)) {
    return false;
  }

  if (length > 0) {
    std::memcpy(buffer_.data() + cursor_, p_data, length);
  }
  cursor_ += length;

  return true;
}

bool NtlmBufferWriter::WriteBytes(const Buffer& bytes) {
  return WriteBytes(bytes.data(), bytes.size());
}

bool NtlmBufferWriter::WriteZeros(std::size_t count) {
  if (!CanWrite(count)) {
    return false;
  }

  std::memset(buffer_.data() + cursor_, 0, count);
  cursor_ += count;

  return true;
}

bool NtlmBufferWriter::WriteSecurityBuffer(
    const SecurityBuffer& security_buffer) {
  return WriteUInt16(security_buffer.length) &&
         WriteUInt16(security_buffer.length) &&
         WriteUInt32(security_buffer.offset);
}

bool NtlmBufferWriter::WriteAvPair(const AvPair& av_pair) {
  return WriteUInt16(av_pair.avid) &&
         WriteUInt16(static_cast<uint16_t>(av_pair.buffer.size())) &&
         WriteBytes(av_pair.buffer);
}

bool NtlmBufferWriter::WriteAvPairTerminator() {
  return WriteUInt16(kAvEol) && WriteUInt16(0);
}

bool NtlmBufferWriter::WriteSignature() {
  return WriteBytes(kSignature, kSignatureLength);
}

bool NtlmBufferWriter::WriteMessageType(MessageType message_type) {
  return WriteUInt32(message_type);
}

Buffer NtlmBufferWriter::Pass() {
  cursor_ = 0;
  return std::move(buffer_);
}

}  // ntlm
}  // httpntlm
