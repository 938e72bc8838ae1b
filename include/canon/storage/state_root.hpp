#pragma once
#include <canon/schema/primitives.hpp>
#include <canon/storage/storage.hpp>

#include <vector>

namespace canon::storage {

/// Order rows by key and fold them into a single BLAKE3 root. Equal state
/// always yields an equal root, whatever order the rows were produced in.
canon::schema::hash32_t seal_state_rows(std::vector<key_value_entry_t>& rows);

}  // namespace canon::storage
