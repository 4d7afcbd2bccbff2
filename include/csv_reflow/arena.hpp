#pragma once
#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace cr {

// Bump allocator for the cell text of one batch. Memory is handed out from
// fixed blocks, so views returned by copy() stay valid until reset().
class Arena {
public:
  explicit Arena(std::size_t block_bytes = 64 * 1024);

  void* alloc(std::size_t n);
  std::string_view copy(std::string_view s);

  // Rewind to the first block; blocks beyond it are freed.
  void reset() noexcept;

  // Most bytes live at once since construction; survives reset().
  std::size_t high_water() const noexcept { return high_water_; }

private:
  struct Block {
    std::unique_ptr<char[]> data;
    std::size_t size;
  };

  std::size_t block_bytes_;
  std::vector<Block> blocks_;
  std::size_t head_{0};       // offset in blocks_.back()
  std::size_t used_{0};
  std::size_t high_water_{0};
};

}
