#pragma once

#include "model.hpp"
#include "validator.hpp"
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace fillsched {

// CSV with a header naming the Lot ID, Type and Vials columns (aliases
// lot_id/id, type/lot_type, vials/vial_count; case-insensitive). Values are
// returned as raw text for Preflight. Returns false with `error` set when
// the header is missing or a row is malformed.
bool parseLotCsv(std::istream& in, std::vector<RawLotRecord>& records, std::string& error);

// One lot id per line, or a CSV with a Lot ID column. Blank lines and
// lines starting with '#' are skipped.
bool parseSequence(std::istream& in, std::vector<std::string>& ids, std::string& error);

// Start,End,Hours,Activity,Lot ID,Type,Note
void writeScheduleCsv(std::ostream& out, const Schedule& schedule);

// "YYYY-MM-DD HH:MM" (UTC) <-> hours since 1970-01-01 00:00.
bool parseTimestamp(const std::string& text, Hours& out);
std::string formatTimestamp(Hours t);

} // namespace fillsched
