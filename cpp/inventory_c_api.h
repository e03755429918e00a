#pragma once

#ifdef __cplusplus
extern "C" {
#endif

typedef void* PharmiqEngineHandle;

/* Granularity codes: 0 = day, 1 = week, 2 = month. Timestamps are epoch seconds, dates are epoch days. */

PharmiqEngineHandle pharmiq_engine_create();
void pharmiq_engine_destroy(PharmiqEngineHandle handle);
void pharmiq_engine_reserve(PharmiqEngineHandle handle, int expected_records);
const char* pharmiq_engine_set_option(PharmiqEngineHandle handle, const char* key, double value);

void pharmiq_add_consumption(PharmiqEngineHandle handle, const char* item_id, long long timestamp, double quantity);

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
    long long return_deadline_day);

void pharmiq_add_supplier_quote(
    PharmiqEngineHandle handle,
    const char* supplier_id,
    const char* item_id,
    double unit_cost,
    double fixed_order_cost,
    int lead_time_days,
    double minimum_order_quantity);

void pharmiq_clear_snapshot(PharmiqEngineHandle handle);

const char* pharmiq_add_interaction_rule(
    PharmiqEngineHandle handle,
    const char* drug_a,
    const char* drug_b,
    const char* severity,
    const char* description,
    const char* management,
    const char* const* substitutes,
    int substitute_count);
const char* pharmiq_add_drug_category(PharmiqEngineHandle handle, const char* category, const char* drug);
const char* pharmiq_add_category_rule(
    PharmiqEngineHandle handle,
    const char* category_a,
    const char* category_b,
    const char* severity,
    const char* description,
    const char* management);
void pharmiq_clear_rules(PharmiqEngineHandle handle);

const char* pharmiq_forecast_json(PharmiqEngineHandle handle, const char* item_id, int granularity, long long now, int horizon);
const char* pharmiq_anomalies_json(PharmiqEngineHandle handle, const char* item_id, int granularity, long long now);
const char* pharmiq_run_json(PharmiqEngineHandle handle, int granularity, long long now, int horizon);
const char* pharmiq_check_interactions_json(PharmiqEngineHandle handle, const char* const* drug_names, int count);
const char* pharmiq_review_prescription_json(PharmiqEngineHandle handle, const char* const* drug_names, int count);
const char* pharmiq_inventory_valuation_json(PharmiqEngineHandle handle, long long now);

/* 0 = none, 1 = fatal, 2 = error, 3 = warning, 4 = info, 5 = debug, 6 = verbose */
void pharmiq_init_logging(int severity);

void pharmiq_free_string(const char* value);

#ifdef __cplusplus
}
#endif
