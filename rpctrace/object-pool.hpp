#pragma once

#include <memory>
#include <mutex>
#include <vector>

namespace rpctrace {

// Thread-safe pool of reusable objects. T must be default constructible and provide reset(),
// which is called on every acquisition so a pooled object never leaks state between owners.
// An empty pool allocates a new object instead of blocking.
template <typename T>
class ObjectPool : public std::enable_shared_from_this<ObjectPool<T>> {
 public:
  class Releaser {
    std::weak_ptr<ObjectPool> pool;

   public:
    Releaser() = default;
    explicit Releaser(std::weak_ptr<ObjectPool> const& p) : pool(p) {}
    void operator()(T* object) const {
      auto owner = pool.lock();
      if (owner) {
        owner->release(object);
      } else {
        delete object;
      }
    }
  };

  // Objects go back to the pool when the pointer is destroyed or reset
  using Ptr = std::unique_ptr<T, Releaser>;

  static std::shared_ptr<ObjectPool> make() {
    return std::shared_ptr<ObjectPool>(new ObjectPool());
  }

  ~ObjectPool() {
    for (auto* object : pool)
      delete object;
  }

  Ptr acquire() {
    std::unique_lock<std::mutex> lock(mutex);
    T* object = nullptr;
    if (!pool.empty()) {
      object = pool.back();
      pool.pop_back();
    }
    lock.unlock();

    if (object == nullptr) object = new T();
    object->reset();
    return Ptr(object, Releaser(this->shared_from_this()));
  }

  std::size_t pooled_count() const {
    std::lock_guard<std::mutex> lock(mutex);
    return pool.size();
  }

 private:
  ObjectPool() = default;

  void release(T* object) {
    std::lock_guard<std::mutex> lock(mutex);
    pool.push_back(object);
  }

  std::vector<T*> pool;
  mutable std::mutex mutex;
};

}  // namespace rpctrace
