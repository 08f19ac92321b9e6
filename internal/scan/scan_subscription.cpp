#include "scan_subscription.hpp"

#include "internal/observability/logging.hpp"

namespace voucher::scan {

ScanSubscription::ScanSubscription(std::shared_ptr<Scanner> scanner, std::shared_ptr<ScanSession> session, DispositionCallback on_disposition,
                                   ErrorCallback on_error)
    : scanner_(std::move(scanner)), session_(std::move(session)), on_disposition_(std::move(on_disposition)), on_error_(std::move(on_error)) {
}

ScanSubscription::~ScanSubscription() {
  Cancel();
}

void ScanSubscription::Start() {
  std::scoped_lock lock(mutex_);
  if (active_) return;

  auto session        = session_;
  auto on_disposition = on_disposition_;
  auto on_error       = on_error_;

  scanner_->Start(
      [session, on_disposition](const std::string& text) {
        const auto disposition = session->OnDecoded(text);
        if (disposition == DecodeDisposition::kAccepted || disposition == DecodeDisposition::kRejected) {
          VOUCHER_LOG_DEBUG("scan attempt resolved", {observability::StringField("disposition", ToString(disposition))});
        }
        if (on_disposition) on_disposition(text, disposition);
      },
      [on_error](const std::string& error) {
        VOUCHER_LOG_WARN("scanner error", {observability::StringField("error", error)});
        if (on_error) on_error(error);
      });
  active_ = true;
}

void ScanSubscription::Cancel() {
  std::scoped_lock lock(mutex_);
  if (!active_) return;

  scanner_->Stop();
  session_->Close();
  active_ = false;
}

bool ScanSubscription::Active() const {
  std::scoped_lock lock(mutex_);
  return active_;
}

} // namespace voucher::scan
