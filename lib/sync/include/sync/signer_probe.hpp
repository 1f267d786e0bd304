#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <concepts/signer.hpp>
#include <cstdint>
#include <memory>
#include <spdlog/spdlog.h>

namespace status_feed::sync {

/**
 * @brief Readiness of the signing provider as seen by signer_probe.
 */
struct signer_status
{
  enum class phase : std::uint8_t { unknown, checking, available, unavailable };

  phase current{ phase::unknown };
  std::uint32_t checks{ 0 };///< Checks done so far

  auto operator==(const signer_status &) const -> bool = default;
};

/**
 * @brief Waits for the signing provider to become available, with a bounded number of checks.
 *
 * The provider is checked once per interval. It is declared unavailable after max_checks failed
 * checks; once decided, the verdict is cached.
 */
template<concepts::signer Signer> class signer_probe
{
public:
  static constexpr std::chrono::milliseconds default_interval{ 300 };
  static constexpr std::uint32_t default_max_checks = 5;

  signer_probe(const std::shared_ptr<boost::asio::io_context> &io_context,
    const std::shared_ptr<Signer> &signer,
    std::chrono::milliseconds interval = default_interval,
    std::uint32_t max_checks = default_max_checks)
    : io_context_(io_context), signer_(signer), interval_(interval), max_checks_(max_checks)
  {}

  /**
   * @brief Probes the signer until it answers or the check budget is spent.
   *
   * @return Awaitable yielding true if the signer is available
   */
  auto probe() -> boost::asio::awaitable<bool>
  {
    if (status_.current == signer_status::phase::available) { co_return true; }
    if (status_.current == signer_status::phase::unavailable) { co_return false; }

    boost::asio::steady_timer timer(*io_context_);
    while (status_.checks < max_checks_) {
      timer.expires_after(interval_);
      boost::system::error_code error_code;
      co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, error_code));
      if (error_code) { co_return false; }

      status_ = signer_status{ .current = signer_status::phase::checking, .checks = status_.checks + 1 };
      if (signer_->is_available()) {
        spdlog::debug("[signer_probe] Signer available after {} checks", status_.checks);
        status_.current = signer_status::phase::available;
        co_return true;
      }
    }

    spdlog::info("[signer_probe] Signer unavailable after {} checks", status_.checks);
    status_.current = signer_status::phase::unavailable;
    co_return false;
  }

  [[nodiscard]] auto status() const -> signer_status { return status_; }

  [[nodiscard]] auto is_available() const -> bool { return status_.current == signer_status::phase::available; }

private:
  std::shared_ptr<boost::asio::io_context> io_context_;
  std::shared_ptr<Signer> signer_;
  std::chrono::milliseconds interval_;
  std::uint32_t max_checks_;
  signer_status status_;
};

}// namespace status_feed::sync
