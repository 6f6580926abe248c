#include "test_framework.hpp"

#include "matrixnotify/delivery/dispatcher.hpp"
#include "matrixnotify/observability/factory.hpp"
#include "matrixnotify/observability/global.hpp"
#include "matrixnotify/observability/log_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <sstream>

namespace {

class RecordingObserver final : public matrixnotify::observability::IObserver {
public:
  explicit RecordingObserver(std::vector<std::string> &events) : events_(events) {}

  void record_event(const matrixnotify::observability::ObserverEvent &event) override {
    namespace obs = matrixnotify::observability;
    if (std::holds_alternative<obs::DeliveryStartEvent>(event)) {
      events_.push_back("start:" + std::get<obs::DeliveryStartEvent>(event).path);
    } else if (std::holds_alternative<obs::DeliveryEndEvent>(event)) {
      const auto &end = std::get<obs::DeliveryEndEvent>(event);
      events_.push_back(std::string("end:") + (end.success ? "ok" : "failed"));
    } else {
      events_.push_back("error");
    }
  }

  void record_metric(const matrixnotify::observability::ObserverMetric &) override {
    events_.push_back("metric");
  }

  [[nodiscard]] std::string_view name() const override { return "recording"; }

private:
  std::vector<std::string> &events_;
};

} // namespace

void register_observability_tests(std::vector<matrixnotify::tests::TestCase> &tests) {
  using matrixnotify::tests::contains;
  using matrixnotify::tests::require;
  namespace obs = matrixnotify::observability;

  tests.push_back({"observability_factory_backends", [] {
                     matrixnotify::config::Config cfg;
                     require(obs::create_observer(cfg)->name() == "noop", "default is noop");
                     cfg.observability.backend = " LOG ";
                     require(obs::create_observer(cfg)->name() == "log", "log backend");
                     cfg.observability.backend = "none";
                     require(obs::create_observer(cfg)->name() == "noop", "none backend");
                   }});

  tests.push_back({"observability_log_observer_lines", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out);
                     observer.record_event(obs::DeliveryStartEvent{.path = "plaintext",
                                                                   .room_id = "!a:b"});
                     observer.record_event(obs::ErrorEvent{.component = "delivery",
                                                           .message = "boom"});
                     observer.record_metric(
                         obs::RequestLatencyMetric{.latency = std::chrono::milliseconds(12)});
                     const std::string text = out.str();
                     require(contains(text, "[INFO] delivery.start path=plaintext room=!a:b"),
                             "start line: " + text);
                     require(contains(text, "[ERROR] delivery: boom"), "error line");
                     require(contains(text, "[DEBUG] metric.request_latency_ms=12"), "metric line");
                   }});

  tests.push_back({"observability_dispatch_emits_events", [] {
                     std::vector<std::string> events;
                     obs::set_global_observer(std::make_unique<RecordingObserver>(events));

                     auto http = std::make_shared<matrixnotify::testing::MockHttpClient>();
                     const matrixnotify::delivery::Dispatcher dispatcher(http, nullptr);
                     matrixnotify::delivery::DeliveryRequest request;
                     request.room_id = "!abc:matrix.org";
                     request.message = "hi";
                     request.homeserver_url = "https://hs.example.org";
                     request.access_token = "t";
                     const bool ok = dispatcher.dispatch(request).ok();

                     request.message = " ";
                     const bool blank_ok = dispatcher.dispatch(request).ok();
                     obs::set_global_observer(nullptr);

                     require(ok && !blank_ok, "first succeeds, second fails validation");
                     const std::vector<std::string> expected = {"start:plaintext", "metric",
                                                                "end:ok", "error"};
                     require(events == expected, "unexpected event sequence");
                   }});
}
