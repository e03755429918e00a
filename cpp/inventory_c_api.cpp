#include "inventory_c_api.h"

#include "errors.hpp"
#include "inventory_analytics.hpp"
#include "inventory_engine.hpp"
#include "json_writer.hpp"
#include "logging.hpp"
#include "periods.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <plog/Log.h>
#include <sstream>
#include <string>
#include <vector>

using pharmiq::EngineConfig;
using pharmiq::Granularity;
using pharmiq::InventoryEngine;

namespace {

struct Session {
    EngineConfig config;
    InventoryEngine engine;
    pharmiq::RunInput snapshot;
    pharmiq::InteractionRuleBase rules;
    pharmiq::ForecastCache cache;
};

const char* alloc_string(const std::string& value) {
    char* buf = static_cast<char*>(std::malloc(value.size() + 1));
    if (buf == nullptr) return nullptr;
    std::memcpy(buf, value.c_str(), value.size() + 1);
    return buf;
}

std::string str(const char* value) {
    return value ? value : "";
}

Granularity granularity_from(int code) {
    switch (code) {
        case 0:
            return Granularity::DAY;
        case 1:
            return Granularity::WEEK;
        case 2:
            return Granularity::MONTH;
        default:
            throw pharmiq::ConfigurationError("granularity must be 0 (day), 1 (week) or 2 (month)");
    }
}

std::vector<std::string> names_from(const char* const* values, int count) {
    std::vector<std::string> out;
    if (values == nullptr || count <= 0) return out;
    out.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) out.push_back(str(values[i]));
    return out;
}

template <typename Fn>
const char* json_call(Fn&& fn) {
    try {
        return alloc_string(fn());
    } catch (const pharmiq::EngineError& e) {
        return alloc_string(pharmiq::error_json(e.kind(), e.what()));
    } catch (const std::exception& e) {
        PLOG_ERROR << "C API call failed: " << e.what();
        return alloc_string(pharmiq::error_json("internal", e.what()));
    }
}

const std::string kOk = "{\"success\":true}";

}

extern "C" {

PharmiqEngineHandle pharmiq_engine_create() {
    return new Session();
}

void pharmiq_engine_destroy(PharmiqEngineHandle handle) {
    delete static_cast<Session*>(handle);
}

void pharmiq_engine_reserve(PharmiqEngineHandle handle, int expected_records) {
    auto* session = static_cast<Session*>(handle);
    if (expected_records > 0) {
        session->snapshot.records.reserve(static_cast<std::size_t>(expected_records));
    }
}

const char* pharmiq_engine_set_option(PharmiqEngineHandle handle, const char* key, double value) {
    auto* session = static_cast<Session*>(handle);
    return json_call([&] {
        pharmiq::set_option(session->config, str(key), value);
        session->engine = InventoryEngine(session->config);
        return kOk;
    });
}

void pharmiq_add_consumption(PharmiqEngineHandle handle, const char* item_id, long long timestamp, double quantity) {
    auto* session = static_cast<Session*>(handle);
    session->snapshot.records.push_back({str(item_id), static_cast<std::int64_t>(timestamp), quantity});
}

void pharmiq_add_batch(
    PharmiqEngineHandle handle,
    const char* item_id,
    const char* batch_id,
    double quantity_on_hand,
    double quantity_in_transit,
    double unit_cost,
    long long expiry_day,
    int lead_time_days,
    const char* supplier_id,
    int has_return_deadline,
    long long return_deadline_day) {
    auto* session = static_cast<Session*>(handle);
    pharmiq::InventoryState batch;
    batch.item_id = str(item_id);
    batch.batch_id = str(batch_id);
    batch.quantity_on_hand = quantity_on_hand;
    batch.quantity_in_transit = quantity_in_transit;
    batch.unit_cost = unit_cost;
    batch.expiry_day = static_cast<std::int64_t>(expiry_day);
    batch.lead_time_days = lead_time_days;
    batch.supplier_id = str(supplier_id);
    if (has_return_deadline == 1) {
        batch.return_deadline_day = static_cast<std::int64_t>(return_deadline_day);
    }
    session->snapshot.batches.push_back(std::move(batch));
}

void pharmiq_add_supplier_quote(
    PharmiqEngineHandle handle,
    const char* supplier_id,
    const char* item_id,
    double unit_cost,
    double fixed_order_cost,
    int lead_time_days,
    double minimum_order_quantity) {
    auto* session = static_cast<Session*>(handle);
    session->snapshot.suppliers.push_back(pharmiq::SupplierQuote{
        str(supplier_id),
        str(item_id),
        unit_cost,
        fixed_order_cost,
        lead_time_days,
        minimum_order_quantity,
    });
}

void pharmiq_clear_snapshot(PharmiqEngineHandle handle) {
    auto* session = static_cast<Session*>(handle);
    session->snapshot = pharmiq::RunInput{};
}

const char* pharmiq_add_interaction_rule(
    PharmiqEngineHandle handle,
    const char* drug_a,
    const char* drug_b,
    const char* severity,
    const char* description,
    const char* management,
    const char* const* substitutes,
    int substitute_count) {
    auto* session = static_cast<Session*>(handle);
    return json_call([&] {
        session->rules.addRule(pharmiq::InteractionRule{
            str(drug_a),
            str(drug_b),
            pharmiq::parse_severity(str(severity)),
            str(description),
            str(management),
            names_from(substitutes, substitute_count),
        });
        return kOk;
    });
}

const char* pharmiq_add_drug_category(PharmiqEngineHandle handle, const char* category, const char* drug) {
    auto* session = static_cast<Session*>(handle);
    return json_call([&] {
        session->rules.addCategoryMember(str(category), str(drug));
        return kOk;
    });
}

const char* pharmiq_add_category_rule(
    PharmiqEngineHandle handle,
    const char* category_a,
    const char* category_b,
    const char* severity,
    const char* description,
    const char* management) {
    auto* session = static_cast<Session*>(handle);
    return json_call([&] {
        session->rules.addCategoryRule(pharmiq::CategoryRule{
            str(category_a),
            str(category_b),
            pharmiq::parse_severity(str(severity)),
            str(description),
            str(management),
        });
        return kOk;
    });
}

void pharmiq_clear_rules(PharmiqEngineHandle handle) {
    auto* session = static_cast<Session*>(handle);
    session->rules.clear();
}

const char* pharmiq_forecast_json(PharmiqEngineHandle handle, const char* item_id, int granularity, long long now, int horizon) {
    auto* session = static_cast<Session*>(handle);
    return json_call([&] {
        const std::string id = str(item_id);
        const auto series = session->engine.aggregate(id, session->snapshot.records, granularity_from(granularity), now);
        const auto result = session->engine.forecast(id, series, static_cast<std::size_t>(std::max(1, horizon)), now,
                                                     &session->cache);
        std::ostringstream out;
        pharmiq::write_json(out, result);
        return out.str();
    });
}

const char* pharmiq_anomalies_json(PharmiqEngineHandle handle, const char* item_id, int granularity, long long now) {
    auto* session = static_cast<Session*>(handle);
    return json_call([&] {
        const std::string id = str(item_id);
        const auto series = session->engine.aggregate(id, session->snapshot.records, granularity_from(granularity), now);
        std::ostringstream out;
        out << "{\"anomalies\":";
        pharmiq::write_json(out, session->engine.detectAnomalies(series));
        out << ",\"shift\":";
        if (const auto shift = session->engine.detectShift(series)) {
            pharmiq::write_json(out, *shift);
        } else {
            out << "null";
        }
        out << "}";
        return out.str();
    });
}

const char* pharmiq_run_json(PharmiqEngineHandle handle, int granularity, long long now, int horizon) {
    auto* session = static_cast<Session*>(handle);
    return json_call([&] {
        pharmiq::RunInput input = session->snapshot;
        input.granularity = granularity_from(granularity);
        input.now = static_cast<std::int64_t>(now);
        input.horizon_periods = static_cast<std::size_t>(std::max(1, horizon));
        std::ostringstream out;
        pharmiq::write_json(out, session->engine.run(input, &session->cache));
        return out.str();
    });
}

const char* pharmiq_check_interactions_json(PharmiqEngineHandle handle, const char* const* drug_names, int count) {
    auto* session = static_cast<Session*>(handle);
    return json_call([&] {
        std::ostringstream out;
        pharmiq::write_json(out, session->engine.checkInteractions(names_from(drug_names, count), session->rules));
        return out.str();
    });
}

const char* pharmiq_review_prescription_json(PharmiqEngineHandle handle, const char* const* drug_names, int count) {
    auto* session = static_cast<Session*>(handle);
    return json_call([&] {
        std::ostringstream out;
        pharmiq::write_json(out, session->engine.reviewPrescription(names_from(drug_names, count), session->rules));
        return out.str();
    });
}

const char* pharmiq_inventory_valuation_json(PharmiqEngineHandle handle, long long now) {
    auto* session = static_cast<Session*>(handle);
    return json_call([&] {
        const auto& snapshot = session->snapshot;
        std::ostringstream out;
        out << "{\"valuation\":";
        pharmiq::write_json(out, pharmiq::stock_valuation(snapshot.batches, pharmiq::day_of(now)));
        out << ",\"abc\":";
        pharmiq::write_json(out, pharmiq::abc_classification(snapshot.batches));
        out << ",\"turnover\":";
        pharmiq::write_json(out, pharmiq::inventory_turnover(snapshot.records, snapshot.batches, now));
        out << "}";
        return out.str();
    });
}

void pharmiq_init_logging(int severity) {
    const int clamped = std::clamp(severity, 0, 6);
    pharmiq::init_logging(static_cast<plog::Severity>(clamped));
}

void pharmiq_free_string(const char* value) {
    std::free(const_cast<char*>(value));
}

}
