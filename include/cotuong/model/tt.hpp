// include/cotuong/model/tt.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

#include "move.hpp"

#if defined(__GNUC__) || defined(__clang__)
#define COTUONG_LIKELY(x) (__builtin_expect(!!(x), 1))
#define COTUONG_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#define COTUONG_PREFETCH_L1(ptr) __builtin_prefetch((ptr), 0, 3)
#else
#define COTUONG_LIKELY(x) (x)
#define COTUONG_UNLIKELY(x) (x)
#define COTUONG_PREFETCH_L1(ptr) ((void)0)
#endif

namespace cotuong::model {

enum class Bound : std::uint8_t { Exact = 0, Lower = 1, Upper = 2 };

struct TTEntry {
  std::uint64_t key = 0;  // full Zobrist key, checked on probe
  std::int32_t value = 0;
  std::int16_t depth = 0;
  Bound bound = Bound::Exact;
  Move best{};
};

// One entry per slot, slot = key & (slots - 1).
class TranspositionTable {
 public:
  explicit TranspositionTable(std::size_t mb = 16) { resize(mb); }

  void resize(std::size_t mb) {
    std::size_t bytes = mb * 1024ULL * 1024ULL;
    if (bytes < sizeof(Slot)) bytes = sizeof(Slot);
    m_slots = highest_pow2(bytes / sizeof(Slot));
    m_table = std::make_unique<Slot[]>(m_slots);
  }

  void clear() { m_table = std::make_unique<Slot[]>(m_slots); }

  std::size_t slotCount() const noexcept { return m_slots; }

  inline void prefetch(std::uint64_t key) const noexcept {
    COTUONG_PREFETCH_L1(&m_table[index(key)]);
  }

  bool probe_into(std::uint64_t key, TTEntry& out) const noexcept {
    const Slot& s = m_table[index(key)];
    if (COTUONG_UNLIKELY(!s.used)) return false;
    if (COTUONG_UNLIKELY(s.entry.key != key)) return false;
    out = s.entry;
    return true;
  }

  std::optional<TTEntry> probe(std::uint64_t key) const {
    TTEntry tmp{};
    if (probe_into(key, tmp)) return tmp;
    return std::nullopt;
  }

  // Different position in the slot: always overwrite. Same position: keep the deeper result.
  void store(const TTEntry& e) noexcept {
    Slot& s = m_table[index(e.key)];
    if (s.used && s.entry.key == e.key && e.depth < s.entry.depth) return;
    s.entry = e;
    s.used = true;
  }

  void store(std::uint64_t key, std::int32_t value, std::int16_t depth, Bound bound,
             const Move& best) noexcept {
    store(TTEntry{key, value, depth, bound, best});
  }

 private:
  struct Slot {
    TTEntry entry{};
    bool used = false;
  };

  inline std::size_t index(std::uint64_t key) const noexcept {
    return static_cast<std::size_t>(key) & (m_slots - 1);
  }

  static inline std::size_t highest_pow2(std::size_t x) noexcept {
    std::size_t p = 1;
    while ((p << 1) && ((p << 1) <= x)) p <<= 1;
    return p;
  }

  std::unique_ptr<Slot[]> m_table;
  std::size_t m_slots = 1;
};

}  // namespace cotuong::model
