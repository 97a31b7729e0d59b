#pragma once

#include "version.hpp"

// Returns a negative value, zero or a positive value if x orders before, the
// same as or after y. Build metadata never takes part in the comparison and
// counters only do with count_is_char.
int compare_versions(const version &x, const version &y, const options &opts);

class version_less
{
public:
	explicit version_less(const options &opts);

	bool operator()(const version &x, const version &y) const;

private:
	options options_;
};
