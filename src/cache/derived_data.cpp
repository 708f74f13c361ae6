#include <hiecore/cache/derived_data.hpp>
#include <atomic>

namespace hiecore::detail {

size_t next_derived_key_id() {
    static std::atomic<size_t> next{1};
    return next.fetch_add(1);
}

} // namespace hiecore::detail
