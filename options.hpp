#pragma once

struct options
{
	// Drop unparsable lines instead of failing the whole run.
	bool ignore_unparsable = false;

	// Treat a single letter directly after the last digit as a counter (1.0a < 1.0b).
	bool count_is_char = false;
};
