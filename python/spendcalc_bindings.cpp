/**
 * @file spendcalc_bindings.cpp
 * @brief Python bindings for the spendcalc pricing engine using pybind11
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "src/pricing/price_quote.hpp"
#include "src/pricing/pricing_engine.hpp"
#include "src/pricing/reference_schedule.hpp"
#include <expected>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;

namespace {

// Raise ValueError carrying the streamed error struct
template <typename E>
[[noreturn]] void throw_value_error(const E& error) {
    std::ostringstream oss;
    oss << error;
    throw py::value_error(oss.str());
}

template <typename T, typename E>
T unwrap(std::expected<T, E> result) {
    if (!result.has_value()) {
        throw_value_error(result.error());
    }
    return std::move(*result);
}

}  // namespace

PYBIND11_MODULE(spendcalc, m) {
    m.doc() = "Python bindings for spendcalc flex/commit cloud spend pricing";

    // Tier structure
    py::class_<spendcalc::Tier>(m, "Tier")
        .def(py::init<>())
        .def(py::init([](int64_t lower, int64_t upper, double rate) {
            return spendcalc::Tier{lower, upper, rate};
        }), py::arg("lower"), py::arg("upper"), py::arg("rate"))
        .def_readwrite("lower", &spendcalc::Tier::lower)
        .def_readwrite("upper", &spendcalc::Tier::upper)
        .def_readwrite("rate", &spendcalc::Tier::rate)
        .def("__repr__", [](const spendcalc::Tier& t) {
            return "<Tier [" + std::to_string(t.lower) + ", " + std::to_string(t.upper) +
                   "] rate=" + std::to_string(t.rate) + ">";
        });

    // TierTable (immutable, shared with engines)
    py::class_<spendcalc::TierTable, std::shared_ptr<spendcalc::TierTable>>(m, "TierTable")
        .def_static("create", [](std::vector<spendcalc::Tier> tiers) {
            return std::make_shared<spendcalc::TierTable>(
                unwrap(spendcalc::TierTable::create(std::move(tiers))));
        }, py::arg("tiers"), "Validate a tier list into a table (raises ValueError)")
        .def_static("reference", [] {
            return std::make_shared<spendcalc::TierTable>(
                unwrap(spendcalc::TierTable::create(spendcalc::reference_tiers())));
        }, "Shipped 26-tier schedule")
        .def("tiers", [](const spendcalc::TierTable& t) {
            return std::vector<spendcalc::Tier>(t.tiers().begin(), t.tiers().end());
        })
        .def("max_upper", &spendcalc::TierTable::max_upper)
        .def("is_volume_discounted", &spendcalc::TierTable::is_volume_discounted)
        .def("__len__", &spendcalc::TierTable::size);

    // PricingConfig structure
    py::class_<spendcalc::PricingConfig>(m, "PricingConfig")
        .def(py::init<>())
        .def_readwrite("minimum_invoice", &spendcalc::PricingConfig::minimum_invoice)
        .def_readwrite("minimum_invoice_ceiling", &spendcalc::PricingConfig::minimum_invoice_ceiling)
        .def_readwrite("recommend_headroom", &spendcalc::PricingConfig::recommend_headroom);

    // PriceQuote structure
    py::class_<spendcalc::PriceQuote>(m, "PriceQuote")
        .def_readonly("spend", &spendcalc::PriceQuote::spend)
        .def_readonly("commit_amount", &spendcalc::PriceQuote::commit_amount)
        .def_readonly("flex_cost", &spendcalc::PriceQuote::flex_cost)
        .def_readonly("commit_cost", &spendcalc::PriceQuote::commit_cost)
        .def_readonly("savings", &spendcalc::PriceQuote::savings)
        .def_readonly("recommended_commit", &spendcalc::PriceQuote::recommended_commit)
        .def_readonly("max_commit_amount", &spendcalc::PriceQuote::max_commit_amount)
        .def("has_savings", &spendcalc::PriceQuote::has_savings)
        .def("__repr__", [](const spendcalc::PriceQuote& q) {
            return "<PriceQuote flex=" + std::to_string(q.flex_cost) +
                   " commit=" + std::to_string(q.commit_cost) +
                   " savings=" + std::to_string(q.savings) + ">";
        });

    // PricingEngine class
    py::class_<spendcalc::PricingEngine>(m, "PricingEngine")
        .def(py::init([](std::shared_ptr<spendcalc::TierTable> table,
                         const spendcalc::PricingConfig& config) {
            return unwrap(spendcalc::PricingEngine::create(std::move(table), config));
        }), py::arg("table"), py::arg("config") = spendcalc::PricingConfig{})
        .def("flex_price", [](const spendcalc::PricingEngine& e, double spend) {
            return unwrap(e.flex_price(spend));
        }, py::arg("spend"))
        .def("commit_price", [](const spendcalc::PricingEngine& e, double spend, double commit) {
            return unwrap(e.commit_price(spend, commit));
        }, py::arg("spend"), py::arg("commit_amount"))
        .def("recommend_commit_tier", [](const spendcalc::PricingEngine& e, double spend) {
            return unwrap(e.recommend_commit_tier(spend));
        }, py::arg("spend"))
        .def("list_tiers", [](const spendcalc::PricingEngine& e) {
            auto tiers = e.list_tiers();
            return std::vector<spendcalc::Tier>(tiers.begin(), tiers.end());
        })
        .def("quote", [](const spendcalc::PricingEngine& e, double spend, double commit) {
            return unwrap(spendcalc::quote(e, spend, commit));
        }, py::arg("spend"), py::arg("commit_amount") = 0.0);

    m.attr("REFERENCE_SCHEDULE_VERSION") = std::string(spendcalc::kReferenceScheduleVersion);
}
