#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <utility>
#include <vector>

namespace status_feed::core {

/**
 * @brief Observable value replaced wholesale on every change.
 *
 * @tparam T Stored value type
 *
 * Readers hold an immutable shared copy obtained from get(); a writer never mutates it in place
 * but publishes a complete new value, after which every observer is called with the new value.
 */
template<typename T> class snapshot
{
public:
  using observer_t = std::function<void(const T &)>;
  using observer_id = std::size_t;

  snapshot() : value_(std::make_shared<const T>()) {}

  explicit snapshot(T initial) : value_(std::make_shared<const T>(std::move(initial))) {}

  snapshot(const snapshot &) = delete;
  auto operator=(const snapshot &) -> snapshot & = delete;
  snapshot(snapshot &&) = delete;
  auto operator=(snapshot &&) -> snapshot & = delete;
  ~snapshot() = default;

  [[nodiscard]] auto get() const -> std::shared_ptr<const T> { return value_; }

  [[nodiscard]] auto version() const -> std::uint64_t { return version_; }

  /**
   * @brief Replaces the current value and notifies observers.
   *
   * @param next New complete value
   */
  auto publish(T next) -> void
  {
    value_ = std::make_shared<const T>(std::move(next));
    ++version_;
    notify();
  }

  /**
   * @brief Copies the current value, applies a mutation and publishes the result.
   *
   * @param mutate Callable taking a T& to modify the copy
   */
  template<typename Mutator> auto update(Mutator &&mutate) -> void
  {
    T next = *value_;
    std::forward<Mutator>(mutate)(next);
    publish(std::move(next));
  }

  auto subscribe(observer_t observer) -> observer_id
  {
    const auto observer_key = next_observer_id_++;
    observers_.emplace(observer_key, std::move(observer));
    return observer_key;
  }

  auto unsubscribe(observer_id observer_key) -> void { observers_.erase(observer_key); }

  [[nodiscard]] auto observer_count() const -> std::size_t { return observers_.size(); }

private:
  auto notify() -> void
  {
    // Observers may unsubscribe while being notified
    std::vector<observer_t> current;
    current.reserve(observers_.size());
    for (const auto &[observer_key, observer] : observers_) { current.push_back(observer); }

    const auto value = value_;
    for (const auto &observer : current) { observer(*value); }
  }

  std::shared_ptr<const T> value_;
  std::uint64_t version_{ 0 };
  observer_id next_observer_id_{ 0 };
  std::map<observer_id, observer_t> observers_;
};

/**
 * @brief Value derived from a snapshot that only notifies when the derived value changes.
 *
 * @tparam Source Type held by the source snapshot
 * @tparam Value Derived value type
 *
 * The equality predicate decides what counts as a change, so a selector over a map entry can
 * compare by identity (e.g. source event id) instead of by full structural equality.
 */
template<typename Source, typename Value> class selector
{
public:
  using derive_t = std::function<Value(const Source &)>;
  using equal_t = std::function<bool(const Value &, const Value &)>;
  using observer_t = std::function<void(const Value &)>;

  selector(snapshot<Source> &source, derive_t derive, equal_t equal = std::equal_to<Value>{})
    : source_(source), derive_(std::move(derive)), equal_(std::move(equal)), current_(derive_(*source_.get()))
  {
    subscription_ = source_.subscribe([this](const Source &value) { on_source_changed(value); });
  }

  selector(const selector &) = delete;
  auto operator=(const selector &) -> selector & = delete;
  selector(selector &&) = delete;
  auto operator=(selector &&) -> selector & = delete;

  ~selector() { source_.unsubscribe(subscription_); }

  [[nodiscard]] auto get() const -> const Value & { return current_; }

  /// Number of times the derived value changed since construction
  [[nodiscard]] auto change_count() const -> std::size_t { return change_count_; }

  auto on_change(observer_t observer) -> void { observers_.push_back(std::move(observer)); }

private:
  auto on_source_changed(const Source &value) -> void
  {
    auto next = derive_(value);
    if (equal_(current_, next)) { return; }

    current_ = std::move(next);
    ++change_count_;
    for (const auto &observer : observers_) { observer(current_); }
  }

  snapshot<Source> &source_;
  derive_t derive_;
  equal_t equal_;
  Value current_;
  std::size_t change_count_{ 0 };
  typename snapshot<Source>::observer_id subscription_{};
  std::vector<observer_t> observers_;
};

}// namespace status_feed::core
