#pragma once

#include "tracker/Report.hpp"
#include "tracker/Sources.hpp"

#include <vector>

namespace tracker {

struct MergeResult
{
	size_t appended;
	size_t skipped;
	size_t forwardFailures;
};

/**
 * Appends the records whose date the currency's sheet does not hold yet, in
 * ascending date order.  Each new row is first offered to the forwarder, if
 * any, then written to the report and to the delta report, if any.
 */
class ReportMerger
{
public:
	ReportMerger(Report & report, Report * delta = nullptr, Forwarder * forwarder = nullptr);

	// throws PersistenceError; forwarding failures are only counted
	MergeResult merge(Currency const & currency, std::vector<DailyRecord> const & records);

private:
	Report & report;
	Report * delta;
	Forwarder * forwarder;
};

}
