#include "strata/delta.hpp"

#include "strata/consts.hpp"
#include "strata/error.hpp"

#include <algorithm>
#include <span>
#include <string>
#include <unordered_map>

namespace strata::delta {

std::vector<Text> split_lines(const Text &text) {
  std::vector<Text> out;
  Text cur;
  for (const char32_t c : text) {
    cur.push_back(c);
    if (c == U'\n') {
      out.push_back(std::move(cur));
      cur.clear();
    }
  }
  if (!cur.empty()) {
    out.push_back(std::move(cur));
  }
  return out;
}

namespace {

// Beyond this many line edits the script is a plain replace.
constexpr int kMaxEditDistance = 2048;

// Lines interned to small integers so the diff compares ints, not strings.
std::vector<int> intern(const std::vector<Text> &lines, std::unordered_map<Text, int> &ids) {
  std::vector<int> out;
  out.reserve(lines.size());
  for (const auto &l : lines) {
    auto [it, _] = ids.try_emplace(l, static_cast<int>(ids.size()));
    out.push_back(it->second);
  }
  return out;
}

// Myers O(ND) diff to produce ops: '=' keep, '-' only in a, '+' only in b.
// trace[d] keeps the furthest-reaching x per diagonal k in [-d, d] as they
// stood before layer d was explored, so memory grows with max_d squared.
// Returns false without touching `ops` when the script needs more than
// max_d edits.
bool myers_diff(std::span<const int> a, std::span<const int> b, int max_d,
                std::vector<char> &ops) {
  const int N = static_cast<int>(a.size());
  const int M = static_cast<int>(b.size());
  const int MAX = N + M;
  const int OFFSET = MAX;
  std::vector<int> v(2 * MAX + 2, 0);
  std::vector<std::vector<int>> trace;

  int found = -1;
  for (int d = 0; d <= std::min(MAX, max_d) && found < 0; ++d) {
    trace.emplace_back(v.begin() + (OFFSET - d), v.begin() + (OFFSET + d + 1));
    for (int k = -d; k <= d; k += 2) {
      int x;
      if (k == -d || (k != d && v[OFFSET + k - 1] < v[OFFSET + k + 1])) {
        x = v[OFFSET + k + 1];     // down (insertion)
      } else {
        x = v[OFFSET + k - 1] + 1; // right (deletion)
      }
      int y = x - k;
      while (x < N && y < M && a[x] == b[y]) { ++x; ++y; }
      v[OFFSET + k] = x;
      if (x >= N && y >= M) {
        found = d;
        break;
      }
    }
  }
  if (found < 0) {
    return false;
  }

  std::vector<char> rev_ops;
  int x = N;
  int y = M;
  for (int d = found; d > 0; --d) {
    const auto &vv = trace[d];
    const int k = x - y;
    const auto at = [&](int kk) { return vv[kk + d]; };
    const bool down = k == -d || (k != d && at(k - 1) < at(k + 1));
    const int prev_k = down ? k + 1 : k - 1;
    const int prev_x = at(prev_k);
    const int prev_y = prev_x - prev_k;
    const int mid_x = down ? prev_x : prev_x + 1;
    while (x > mid_x) { rev_ops.push_back('='); --x; --y; }
    rev_ops.push_back(down ? '+' : '-');
    x = prev_x;
    y = prev_y;
  }
  while (x > 0 && y > 0) { rev_ops.push_back('='); --x; --y; }
  ops.insert(ops.end(), rev_ops.rbegin(), rev_ops.rend());
  return true;
}

void emit(Delta &out, Op op, const Text &line) {
  if (!out.empty() && out.back().op == op) {
    out.back().count += line.size();
    if (op == Op::Insert) {
      out.back().literal += line;
    }
    return;
  }
  out.push_back(Instruction{.op = op,
                            .count = line.size(),
                            .literal = op == Op::Insert ? line : Text{}});
}

[[noreturn]] void corrupt(const std::string &why) {
  throw Error(ErrorKind::CorruptDelta, "corrupt delta: " + why);
}

} // namespace

Delta compute_delta(const Text &from, const Text &to) {
  const auto a = split_lines(from);
  const auto b = split_lines(to);
  std::unordered_map<Text, int> ids;
  const auto ia = intern(a, ids);
  const auto ib = intern(b, ids);

  // Common head and tail lines never enter the diff.
  std::size_t head = 0;
  while (head < ia.size() && head < ib.size() && ia[head] == ib[head]) {
    ++head;
  }
  std::size_t tail = 0;
  while (tail < ia.size() - head && tail < ib.size() - head &&
         ia[ia.size() - 1 - tail] == ib[ib.size() - 1 - tail]) {
    ++tail;
  }
  const std::span<const int> mid_a(ia.data() + head, ia.size() - head - tail);
  const std::span<const int> mid_b(ib.data() + head, ib.size() - head - tail);

  std::vector<char> ops;
  ops.reserve(a.size() + b.size());
  ops.assign(head, '=');
  if (!myers_diff(mid_a, mid_b, kMaxEditDistance, ops)) {
    // Too different to be worth matching: drop the old middle, insert the new.
    ops.insert(ops.end(), mid_a.size(), '-');
    ops.insert(ops.end(), mid_b.size(), '+');
  }
  ops.insert(ops.end(), tail, '=');

  Delta out;
  std::size_t pa = 0;
  std::size_t pb = 0;
  for (const char op : ops) {
    if (op == '=') {
      emit(out, Op::Copy, a[pa++]);
      ++pb;
    } else if (op == '-') {
      emit(out, Op::Skip, a[pa++]);
    } else {
      emit(out, Op::Insert, b[pb++]);
    }
  }
  return out;
}

Text apply_delta(const Text &from, const Delta &delta) {
  Text out;
  std::size_t pos = 0;
  for (const auto &ins : delta) {
    switch (ins.op) {
    case Op::Copy:
      if (ins.count > from.size() - pos) {
        corrupt("copy past end of source");
      }
      out.append(from, pos, ins.count);
      pos += ins.count;
      break;
    case Op::Skip:
      if (ins.count > from.size() - pos) {
        corrupt("skip past end of source");
      }
      pos += ins.count;
      break;
    case Op::Insert:
      if (ins.literal.size() != ins.count) {
        corrupt("insert length mismatch");
      }
      out += ins.literal;
      break;
    }
  }
  return out;
}

std::string serialize(const Delta &delta) {
  std::string out;
  for (const auto &ins : delta) {
    switch (ins.op) {
    case Op::Copy:
      out.push_back(consts::kOpCopy);
      break;
    case Op::Skip:
      out.push_back(consts::kOpSkip);
      break;
    case Op::Insert:
      out.push_back(consts::kOpInsert);
      break;
    }
    out.push_back(consts::kSpace);
    out += std::to_string(ins.count);
    out.push_back(consts::kLF);
    if (ins.op == Op::Insert) {
      out += text::encode_utf8(ins.literal);
      out.push_back(consts::kLF);
    }
  }
  return out;
}

Delta parse(std::string_view utf8) {
  const auto decoded = text::decode_utf8(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(utf8.data()),
                                    utf8.size()));
  if (!decoded) {
    corrupt("not valid UTF-8");
  }
  const Text &src = *decoded;

  Delta out;
  std::size_t i = 0;
  while (i < src.size()) {
    // "<op> <count>\n"
    if (i + 2 >= src.size() || src[i + 1] != U' ') {
      corrupt("truncated instruction header");
    }
    Op op;
    switch (src[i]) {
    case U'c':
      op = Op::Copy;
      break;
    case U's':
      op = Op::Skip;
      break;
    case U'i':
      op = Op::Insert;
      break;
    default:
      corrupt("unknown opcode");
    }
    i += 2;
    std::size_t count = 0;
    const std::size_t digits_at = i;
    while (i < src.size() && src[i] >= U'0' && src[i] <= U'9') {
      count = count * 10 + static_cast<std::size_t>(src[i] - U'0');
      ++i;
    }
    if (i == digits_at || i >= src.size() || src[i] != U'\n') {
      corrupt("bad instruction count");
    }
    ++i;

    Instruction ins{.op = op, .count = count, .literal = {}};
    if (op == Op::Insert) {
      if (count > src.size() - i || i + count >= src.size() || src[i + count] != U'\n') {
        corrupt("insert literal not terminated");
      }
      ins.literal = src.substr(i, count);
      i += count + 1;
    }
    out.push_back(std::move(ins));
  }
  return out;
}

} // namespace strata::delta
