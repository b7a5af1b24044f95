#include "ledger_core/monitoring/metric_registry.h"

#include <utility>

#if LEDGER_CORE_WITH_METRICS
#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#endif

namespace ledger_core {

MonitoringCounter::MonitoringCounter(std::function<void(double)> fn)
    : fn_(std::move(fn)) {}

void MonitoringCounter::Increment(double value) const {
    if (fn_) {
        fn_(value);
    }
}

MonitoringGauge::MonitoringGauge(std::function<void(double)> fn)
    : fn_(std::move(fn)) {}

void MonitoringGauge::Set(double value) const {
    if (fn_) {
        fn_(value);
    }
}

MonitoringHistogram::MonitoringHistogram(std::function<void(double)> fn)
    : fn_(std::move(fn)) {}

void MonitoringHistogram::Observe(double value) const {
    if (fn_) {
        fn_(value);
    }
}

MetricRegistry& MetricRegistry::Instance() {
    static MetricRegistry instance;
    return instance;
}

MetricRegistry::MetricRegistry() {
#if LEDGER_CORE_WITH_METRICS
    registry_ = std::make_shared<prometheus::Registry>();
#endif
}

std::string MetricRegistry::BuildMetricKey(const std::string& name, const MetricLabels& labels) {
    std::string key = name;
    for (const auto& [label_key, label_value] : labels) {
        key += "|" + label_key + "=" + label_value;
    }
    return key;
}

#if LEDGER_CORE_WITH_METRICS
namespace {

// Families and children live as long as the registry; the maps hold raw pointers keyed by
// "<kind>:<name>" and "<kind>:<metric key>".
template <typename Metric, typename Builder, typename AddFn>
Metric* FindOrAdd(std::unordered_map<std::string, void*>* families,
                  std::unordered_map<std::string, void*>* metrics,
                  prometheus::Registry* registry,
                  const std::string& kind,
                  const std::string& name,
                  const std::string& help,
                  const std::string& metric_key,
                  Builder builder,
                  AddFn add) {
    const auto metric_it = metrics->find(kind + ":" + metric_key);
    if (metric_it != metrics->end()) {
        return reinterpret_cast<Metric*>(metric_it->second);
    }
    prometheus::Family<Metric>* family = nullptr;
    const auto family_it = families->find(kind + ":" + name);
    if (family_it == families->end()) {
        family = &builder.Name(name).Help(help).Register(*registry);
        (*families)[kind + ":" + name] = family;
    } else {
        family = reinterpret_cast<prometheus::Family<Metric>*>(family_it->second);
    }
    Metric* metric = &add(family);
    (*metrics)[kind + ":" + metric_key] = metric;
    return metric;
}

}  // namespace
#endif

std::shared_ptr<MonitoringCounter> MetricRegistry::BuildCounter(const std::string& name,
                                                                const std::string& help,
                                                                const MetricLabels& labels) {
#if !LEDGER_CORE_WITH_METRICS
    (void)name;
    (void)help;
    (void)labels;
    return std::make_shared<MonitoringCounter>();
#else
    std::lock_guard<std::mutex> lock(mutex_);
    auto* metric = FindOrAdd<prometheus::Counter>(
        &families_, &metrics_, registry_.get(), "counter", name, help,
        BuildMetricKey(name, labels), prometheus::BuildCounter(),
        [&labels](prometheus::Family<prometheus::Counter>* family) -> prometheus::Counter& {
            return family->Add(labels);
        });
    return std::make_shared<MonitoringCounter>([metric](double value) { metric->Increment(value); });
#endif
}

std::shared_ptr<MonitoringGauge> MetricRegistry::BuildGauge(const std::string& name,
                                                            const std::string& help,
                                                            const MetricLabels& labels) {
#if !LEDGER_CORE_WITH_METRICS
    (void)name;
    (void)help;
    (void)labels;
    return std::make_shared<MonitoringGauge>();
#else
    std::lock_guard<std::mutex> lock(mutex_);
    auto* metric = FindOrAdd<prometheus::Gauge>(
        &families_, &metrics_, registry_.get(), "gauge", name, help,
        BuildMetricKey(name, labels), prometheus::BuildGauge(),
        [&labels](prometheus::Family<prometheus::Gauge>* family) -> prometheus::Gauge& {
            return family->Add(labels);
        });
    return std::make_shared<MonitoringGauge>([metric](double value) { metric->Set(value); });
#endif
}

std::shared_ptr<MonitoringHistogram> MetricRegistry::BuildHistogram(
    const std::string& name,
    const std::string& help,
    const std::vector<double>& buckets,
    const MetricLabels& labels) {
#if !LEDGER_CORE_WITH_METRICS
    (void)name;
    (void)help;
    (void)buckets;
    (void)labels;
    return std::make_shared<MonitoringHistogram>();
#else
    std::lock_guard<std::mutex> lock(mutex_);
    auto* metric = FindOrAdd<prometheus::Histogram>(
        &families_, &metrics_, registry_.get(), "histogram", name, help,
        BuildMetricKey(name, labels), prometheus::BuildHistogram(),
        [&labels, &buckets](prometheus::Family<prometheus::Histogram>* family)
            -> prometheus::Histogram& { return family->Add(labels, buckets); });
    return std::make_shared<MonitoringHistogram>(
        [metric](double value) { metric->Observe(value); });
#endif
}

#if LEDGER_CORE_WITH_METRICS
std::shared_ptr<prometheus::Registry> MetricRegistry::GetPrometheusRegistry() const {
    return registry_;
}
#endif

}  // namespace ledger_core
