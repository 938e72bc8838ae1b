#pragma once
#include <canon/schema/events.hpp>
#include <canon/schema/primitives.hpp>
#include <canon/schema/receipt.hpp>

#include <array>
#include <optional>

// Row codec for persisted state and event values. Rows are SCALE tuples of
// fixed-width fields; amounts are stored as 16 little-endian bytes and enums
// as their underlying byte.
namespace canon::schema::encoding {

using amount_bytes_t = std::array<uint8_t, 16>;

amount_bytes_t to_amount_bytes(const canon::schema::amount_t& value);
canon::schema::amount_t from_amount_bytes(const amount_bytes_t& bytes);

canon::schema::bytes_t encode_event_record(
    const canon::schema::event_record_t& record);
std::optional<canon::schema::event_record_t> try_decode_event_record(
    const canon::schema::bytes_view_t& bytes);

canon::schema::bytes_t encode_receipt(const canon::schema::receipt_t& value);
std::optional<canon::schema::receipt_t> try_decode_receipt(
    const canon::schema::bytes_view_t& bytes);

}  // namespace canon::schema::encoding
