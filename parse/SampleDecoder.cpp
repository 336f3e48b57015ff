#include "SampleDecoder.hpp"

#include <cctype>
#include <charconv>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace promscope::parse {

namespace {

static inline bool isWordChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static inline void skipSpaces(std::string_view sv, size_t& i) {
  while (i < sv.size() && (sv[i] == ' ' || sv[i] == '\t')) ++i;
}

// A space outside a quoted label value means more than two tokens.
static bool hasBareSpace(std::string_view sv) {
  bool quoted = false;
  for (size_t i = 0; i < sv.size(); ++i) {
    char c = sv[i];
    if (quoted && c == '\\') { ++i; continue; }
    if (c == '"') quoted = !quoted;
    else if (c == ' ' && !quoted) return true;
  }
  return false;
}

// Rough base-10 exponent of an unsigned decimal literal: positive when its
// magnitude is at least 1, non-positive below that.
static long long decimalMagnitude(std::string_view sv) {
  auto e = sv.find_first_of("eE");
  auto mant = sv.substr(0, e);
  long long exp = 0;
  if (e != std::string_view::npos) {
    auto es = sv.substr(e + 1);
    if (!es.empty() && es.front() == '+') es.remove_prefix(1);
    auto [p, ec] = std::from_chars(es.data(), es.data() + es.size(), exp);
    if (ec == std::errc::result_out_of_range) exp = es.front() == '-' ? -(1LL << 40) : (1LL << 40);
  }
  auto dot = mant.find('.');
  auto ip = mant.substr(0, dot);
  auto lead = ip.find_first_not_of('0');
  if (lead != std::string_view::npos) return static_cast<long long>(ip.size() - lead) + exp;
  long long zeros = 0;
  if (dot != std::string_view::npos) {
    auto fp = mant.substr(dot + 1);
    auto nz = fp.find_first_not_of('0');
    zeros = static_cast<long long>(nz == std::string_view::npos ? fp.size() : nz);
  }
  return exp - zeros;
}

static DecodeResult skip(SkipReason reason) {
  DecodeResult r;
  r.reason = reason;
  return r;
}

} // namespace

bool ParseLabels(std::string_view body, Labels& out) {
  size_t i = 0;
  const size_t n = body.size();
  while (true) {
    skipSpaces(body, i);
    if (i == n) return true;
    // key
    size_t k0 = i;
    while (i < n && isWordChar(body[i])) ++i;
    if (i == k0) return false;
    std::string key(body.substr(k0, i - k0));
    skipSpaces(body, i);
    if (i == n || body[i] != '=') return false;
    ++i;
    skipSpaces(body, i);
    if (i == n || body[i] != '"') return false;
    ++i;
    // value up to the next unescaped quote
    std::string val;
    bool closed = false;
    while (i < n) {
      char c = body[i++];
      if (c == '"') { closed = true; break; }
      if (c == '\\' && i < n) {
        char e = body[i++];
        val.push_back(e == 'n' ? '\n' : e);
        continue;
      }
      val.push_back(c);
    }
    if (!closed) return false;
    out.insert_or_assign(std::move(key), std::move(val));
    skipSpaces(body, i);
    if (i == n) return true;
    if (body[i] != ',') return false;
    ++i;
  }
}

bool ParseValue(std::string_view sv, double& out) {
  // from_chars takes no leading '+', but "+Inf" is a valid sample value
  if (!sv.empty() && sv.front() == '+') {
    sv.remove_prefix(1);
    if (!sv.empty() && (sv.front() == '+' || sv.front() == '-')) return false;
  }
  if (sv.empty()) return false;
  double v = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
  if (ptr != sv.data() + sv.size()) return false;
  if (ec == std::errc::result_out_of_range) {
    // overflow saturates to infinity, underflow flushes to zero
    const bool neg = sv.front() == '-';
    if (decimalMagnitude(neg ? sv.substr(1) : sv) > 0)
      out = neg ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
    else
      out = neg ? -0.0 : 0.0;
    return true;
  }
  if (ec != std::errc{}) return false;
  out = v;
  return true;
}

DecodeResult DecodeSample(std::string_view line) {
  auto sp = line.rfind(' ');
  if (sp == std::string_view::npos) return skip(SkipReason::BadSplit);
  auto head = line.substr(0, sp);
  auto vs = line.substr(sp + 1);
  if (vs.empty() || head.empty() || hasBareSpace(head)) return skip(SkipReason::BadSplit);

  DecodedSample s;
  auto lb = head.find('{');
  if (lb == std::string_view::npos) {
    s.name = std::string(head);
  } else {
    // closing delimiter is the last '}' and nothing may follow it
    auto rb = head.rfind('}');
    if (rb == std::string_view::npos || rb < lb || rb + 1 != head.size()) return skip(SkipReason::BadLabels);
    s.name = std::string(head.substr(0, lb));
    if (!ParseLabels(head.substr(lb + 1, rb - lb - 1), s.labels)) return skip(SkipReason::BadLabels);
  }
  if (s.name.empty()) return skip(SkipReason::EmptyName);
  if (!ParseValue(vs, s.value)) return skip(SkipReason::BadValue);

  DecodeResult r;
  r.sample = std::move(s);
  return r;
}

} // namespace promscope::parse
