#ifndef SHAREDIDX_PROGRESS_HPP
#define SHAREDIDX_PROGRESS_HPP

#include <atomic>
#include <mutex>
#include <string>

namespace sharedidx {

/**
 * @brief Progress and cancellation channel shared between a caller and a
 * long running load.
 *
 * All methods are thread-safe. Workers call checkCanceled() at safe points;
 * the caller calls cancel() from any thread.
 */
class ProgressIndicator {
public:
  ProgressIndicator() = default;
  virtual ~ProgressIndicator() = default;

  ProgressIndicator(const ProgressIndicator &) = delete;
  ProgressIndicator &operator=(const ProgressIndicator &) = delete;

  void cancel();
  bool isCanceled() const;

  /// @throws CancellationError if cancel() was called.
  void checkCanceled() const;

  void setText(const std::string &text);
  std::string getText() const;

  /// Fraction of work done, clamped to [0, 1].
  void setFraction(double fraction);
  double getFraction() const;

private:
  std::atomic<bool> canceled_{false};
  std::atomic<double> fraction_{0.0};
  mutable std::mutex textMutex_;
  std::string text_;
};

} // namespace sharedidx

#endif // SHAREDIDX_PROGRESS_HPP
