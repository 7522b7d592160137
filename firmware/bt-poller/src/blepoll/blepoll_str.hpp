/*
 * Copyright (c) 2023 Allterco Robotics
 * All rights reserved
 */

#pragma once

#include "common/mg_str.h"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "common/util/status.h"
#include "common/util/statusor.h"
#include "mgos_json_utils.hpp"
#include "mgos_utils.hpp"

namespace blepoll {

using mgos::Errorf;
using mgos::SPrintf;
using mgos::StatusOr;

#define blepoll_str mg_str
#define BLEPOLL_NULL_STR MG_NULL_STR

class Status : public mgos::Status {
 public:
  Status() : mgos::Status() {}
  Status(int code, const char *msg) : mgos::Status(code, msg) {}
  Status(int code, const std::string &msg) : mgos::Status(code, msg) {}
  Status(const mgos::Status &other) : mgos::Status(other) {}
  static Status OK() { return Status(); }
  static Status NOT_FOUND() { return Status(STATUS_NOT_FOUND, "Not found"); }
  static Status INVALID_ARGUMENT() {
    return Status(STATUS_INVALID_ARGUMENT, "Invalid argument");
  }
  static Status UNAVAILABLE() {
    return Status(STATUS_UNAVAILABLE, "Unavailable");
  }
};

// Pointer + length view over bytes or text, small enough to pass by value.
// Memory layout is compatible with struct mg_str, so notification payloads
// handed out by the BT stack can be wrapped without copying.
struct Str : public blepoll_str {
  Str() : Str(nullptr, 0) {}
  Str(const void *p_, size_t len_) {
    p = static_cast<const char *>(p_);
    len = len_;
  }
  Str(const char *s);
  Str(const Str &other) : Str(other.p, other.len) {}
  Str(const struct blepoll_str &other) : Str(other.p, other.len) {}
  Str(const std::string &s) : Str(s.data(), s.length()) {}
  Str(const std::vector<uint8_t> &v) : Str(v.data(), v.size()) {}

  // No construction from temporaries, the view would dangle.
  Str(const std::string &&s) = delete;

  Str &operator=(const Str &other) {
    p = other.p;
    len = other.len;
    return *this;
  }

  const uint8_t *up() const { return (const uint8_t *) p; }
  const char *SafeP() const;  // Returns empty string when p is null.

  inline const char *data() const { return p; }
  inline size_t length() const { return len; }
  inline size_t size() const { return len; }
  inline bool empty() const { return (len == 0); }
  inline void clear() {
    len = 0;
    p = nullptr;
  }
  static constexpr size_t npos = std::string::npos;
  size_t find(char ch, size_t pos = 0) const;
  Str substr(size_t pos = 0, size_t count = npos) const;

  int Cmp(Str other) const;
  int CaseCmp(Str other) const;
  bool operator==(Str other) const;
  bool operator==(const char *other) const;
  bool operator!=(Str other) const { return !(*this == other); }
  bool operator!=(const char *other) const { return !(*this == other); }
  bool operator<(Str other) const { return Cmp(other) < 0; }

  // Byte access. Notification payloads are binary, hence unsigned.
  uint8_t operator[](size_t i) const { return static_cast<uint8_t>(p[i]); }

  bool StartsWith(Str prefix) const;

  void ChopLeft(size_t n);
  void ChopRight(size_t n) { len -= n; }

  // Splits the string on the given separator into two parts.
  // Returns true if the separator was found, false of not.
  // If false is returned, before contains the entire string
  // and after is empty.
  bool SplitOn(char sep, Str &before, Str &after) const;
  std::vector<Str> SplitOn(char sep, bool skip_empty = false) const;

  // Return Str with whitespace stripped on both ends.
  Str Strip() const;

  std::string ToString() const;

  std::string ToHexString(bool upper = false) const;
  bool HexDecode(void *out, size_t &out_size) const;

  // Base 10 and 16 conversions are supported.
  StatusOr<uint8_t> ToUInt8(int base = 10) const;
};

// Useful macro for using in printf.
#define BLEPOLLSTRF(s) (unsigned) (s).len, (s).SafeP()

static_assert(sizeof(Str) == sizeof(struct blepoll_str),
              "blepoll::Str must be the same size as mg_str");

}  // namespace blepoll
