#include "utilities/progress.hpp"
#include "utilities/errors.hpp"

#include <algorithm>

namespace sharedidx {

void ProgressIndicator::cancel() { canceled_ = true; }

bool ProgressIndicator::isCanceled() const { return canceled_; }

void ProgressIndicator::checkCanceled() const {
  if (canceled_) {
    throw CancellationError();
  }
}

void ProgressIndicator::setText(const std::string &text) {
  std::lock_guard<std::mutex> lock(textMutex_);
  text_ = text;
}

std::string ProgressIndicator::getText() const {
  std::lock_guard<std::mutex> lock(textMutex_);
  return text_;
}

void ProgressIndicator::setFraction(double fraction) {
  fraction_ = std::clamp(fraction, 0.0, 1.0);
}

double ProgressIndicator::getFraction() const { return fraction_; }

} // namespace sharedidx
