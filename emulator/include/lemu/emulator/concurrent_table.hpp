#ifndef LEMU_EMULATOR_CONCURRENT_TABLE_HPP
#define LEMU_EMULATOR_CONCURRENT_TABLE_HPP

#include <string>

#include <tbb/concurrent_hash_map.h>

namespace lemu::emulator {

  template <typename Value, typename Key = std::string>
  struct ConcurrentTable {

    using table_t = oneapi::tbb::concurrent_hash_map<Key, Value>;

    // Exclusive access to a single element; insertions and erasures.
    using rw_acc_t = typename table_t::accessor;

    // Shared access, valid as long as the accessor is alive.
    using ro_acc_t = typename table_t::const_accessor;
  };

} // namespace lemu::emulator

#endif
