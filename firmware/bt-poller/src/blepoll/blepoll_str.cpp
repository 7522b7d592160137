/*
 * Copyright (c) 2023 Allterco Robotics
 * All rights reserved
 */

#include "blepoll_str.hpp"

#include <algorithm>
#include <cctype>

namespace blepoll {

const size_t Str::npos;

Str::Str(const char *s) {
  p = s;
  len = (s ? std::strlen(s) : 0);
}

const char *Str::SafeP() const {
  return (p != nullptr ? p : "");
}

bool Str::operator==(Str other) const {
  if (len != other.len) return false;
  if (len == 0) return true;
  if (p == nullptr || other.p == nullptr) return (p == other.p);
  return (std::memcmp(p, other.p, len) == 0);
}

bool Str::operator==(const char *other) const {
  return (*this == Str(other));
}

int Str::Cmp(Str other) const {
  const size_t min_len = std::min(len, other.len);
  if (min_len > 0) {
    int res = std::memcmp(p, other.p, min_len);
    if (res != 0) return (res > 0 ? 1 : -1);
  }
  if (len == other.len) return 0;
  return (len < other.len ? -1 : 1);
}

int Str::CaseCmp(Str other) const {
  const size_t min_len = std::min(len, other.len);
  for (size_t i = 0; i < min_len; i++) {
    const int c = std::tolower(p[i]);
    const int other_c = std::tolower(other.p[i]);
    if (c < other_c) return -1;
    if (c > other_c) return 1;
  }
  if (len == other.len) return 0;
  return (len < other.len ? -1 : 1);
}

bool Str::StartsWith(Str prefix) const {
  if (len < prefix.len) return false;
  return (substr(0, prefix.len) == prefix);
}

size_t Str::find(char ch, size_t pos) const {
  for (size_t i = pos; i < len; i++) {
    if (p[i] == ch) return i;
  }
  return npos;
}

Str Str::substr(size_t pos, size_t count) const {
  if (pos >= len) return Str();
  return Str(p + pos, std::min(count, len - pos));
}

void Str::ChopLeft(size_t n) {
  n = std::min(n, len);
  p += n;
  len -= n;
}

bool Str::SplitOn(char sep, Str &before, Str &after) const {
  const size_t i = find(sep);
  if (i == npos) {
    before = *this;
    after.clear();
    return false;
  }
  const Str bf = substr(0, i), af = substr(i + 1);
  before = bf;
  after = af;
  return true;
}

std::vector<Str> Str::SplitOn(char sep, bool skip_empty) const {
  std::vector<Str> res;
  Str part, rest(*this);
  while (rest.SplitOn(sep, part, rest)) {
    if (!part.empty() || !skip_empty) {
      res.emplace_back(part);
    }
  }
  if (!part.empty() || (!skip_empty && !empty())) {
    res.emplace_back(part);
  }
  return res;
}

Str Str::Strip() const {
  Str res(*this);
  while (!res.empty() && std::isspace(res.p[0])) {
    res.ChopLeft(1);
  }
  while (!res.empty() && std::isspace(res.p[res.len - 1])) {
    res.ChopRight(1);
  }
  return res;
}

std::string Str::ToString() const {
  return (len > 0 && p != nullptr ? std::string(p, len) : std::string());
}

static char hexc(uint8_t c, bool upper) {
  if (c < 10) {
    return '0' + c;
  }
  return (upper ? 'A' : 'a') + (c - 10);
}

std::string Str::ToHexString(bool upper) const {
  std::string res;
  res.reserve(len * 2);
  for (size_t i = 0; i < len; i++) {
    const uint8_t c = (*this)[i];
    res.push_back(hexc(c >> 4, upper));
    res.push_back(hexc(c & 0xf, upper));
  }
  return res;
}

static int GetVal(char c, int base) {
  if (c >= '0' && c <= '9') return c - '0';
  if (base != 16) return -1;
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

bool Str::HexDecode(void *out, size_t &out_size) const {
  if (len % 2 != 0) return false;
  if (out_size < len / 2) return false;
  uint8_t *op = static_cast<uint8_t *>(out);
  for (size_t i = 0; i < len; i += 2) {
    const int v1 = GetVal(p[i], 16), v2 = GetVal(p[i + 1], 16);
    if (v1 < 0 || v2 < 0) return false;
    *op++ = ((v1 << 4) | v2);
  }
  out_size = len / 2;
  return true;
}

StatusOr<uint8_t> Str::ToUInt8(int base) const {
  if (len == 0 || (base != 10 && base != 16)) {
    return Status::INVALID_ARGUMENT();
  }
  unsigned res = 0;
  for (size_t i = 0; i < len; i++) {
    const int val = GetVal(p[i], base);
    if (val < 0) {
      return Status::INVALID_ARGUMENT();
    }
    res = res * base + val;
    if (res > 0xff) {
      return Errorf(STATUS_INVALID_ARGUMENT, "%.*s: out of range",
                    BLEPOLLSTRF(*this));
    }
  }
  return static_cast<uint8_t>(res);
}

}  // namespace blepoll
