#pragma once
#include <cstddef>
#include <memory>
#include <vector>

namespace sv {

// Opaque byte buffer shared between an array and every view derived from it.
// Either owns its bytes (allocate) or borrows foreign memory and keeps the
// foreign owner alive through `keepalive` (adopt).
class Storage {
public:
  static std::shared_ptr<Storage> allocate(std::size_t nbytes);
  static std::shared_ptr<Storage> adopt(void* ptr, std::size_t nbytes,
                                        std::shared_ptr<void> keepalive,
                                        bool writeable = true);

  Storage(const Storage&)            = delete;
  Storage& operator=(const Storage&) = delete;

  std::byte* data() const { return ptr_; }
  std::size_t nbytes() const { return nbytes_; }
  bool writeable() const { return writeable_; }
  bool owns_data() const { return keepalive_ == nullptr; }

private:
  Storage() = default;

  std::vector<std::byte> owned_;
  std::byte* ptr_ = nullptr;
  std::size_t nbytes_ = 0;
  bool writeable_ = true;
  std::shared_ptr<void> keepalive_;
};

} // namespace sv
