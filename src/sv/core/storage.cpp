#include "sv/core/storage.hpp"
#include <stdexcept>

namespace sv {

std::shared_ptr<Storage> Storage::allocate(std::size_t nbytes) {
  std::shared_ptr<Storage> s(new Storage());
  s->owned_.assign(nbytes, std::byte{0});
  s->ptr_ = s->owned_.data();
  s->nbytes_ = nbytes;
  return s;
}

std::shared_ptr<Storage> Storage::adopt(void* ptr, std::size_t nbytes,
                                        std::shared_ptr<void> keepalive,
                                        bool writeable) {
  if (!ptr && nbytes != 0) throw std::invalid_argument("Storage::adopt: null pointer with non-zero extent");
  if (!keepalive) throw std::invalid_argument("Storage::adopt: keepalive owner required");
  std::shared_ptr<Storage> s(new Storage());
  s->ptr_ = static_cast<std::byte*>(ptr);
  s->nbytes_ = nbytes;
  s->writeable_ = writeable;
  s->keepalive_ = std::move(keepalive);
  return s;
}

} // namespace sv
