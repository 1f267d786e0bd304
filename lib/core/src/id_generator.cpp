#include <core/id_generator.hpp>

#include <algorithm>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cstddef>

namespace status_feed::core {

namespace {
  constexpr std::size_t max_subscription_id_length = 64;
  constexpr std::size_t random_part_length = 32;

  auto next_uuid() -> boost::uuids::uuid
  {
    static thread_local boost::uuids::random_generator gen;
    return gen();
  }
}// namespace

auto generate_uuid() -> std::string { return boost::uuids::to_string(next_uuid()); }

auto generate_subscription_id(std::string_view purpose) -> std::string
{
  auto random_part = boost::uuids::to_string(next_uuid());
  std::erase(random_part, '-');

  const auto purpose_length = std::min(purpose.size(), max_subscription_id_length - random_part_length - 1);
  std::string subscription_id(purpose.substr(0, purpose_length));
  subscription_id += '-';
  subscription_id += random_part;
  return subscription_id;
}

}// namespace status_feed::core
