#include <algorithm>
#include <hashlock/schema/encoding/layout/encoder.hpp>

using namespace hashlock::schema;

namespace hashlock::schema::encoding {

void record_layout<execution_tracker_t>::write(
    const execution_tracker_t& record,
    uint8_t* destination) {
  std::ranges::copy(record.execution_handle, destination);
}

execution_tracker_t record_layout<execution_tracker_t>::read(
    const uint8_t* source) {
  auto record = execution_tracker_t{};
  std::copy_n(source, record.execution_handle.size(),
              record.execution_handle.begin());
  return record;
}

}  // namespace hashlock::schema::encoding
