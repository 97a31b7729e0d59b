#include <catch2/catch.hpp>

#include <algorithm>
#include <cstdlib>
#include <sstream>

#include "exception.hpp"
#include "versort.hpp"

namespace
{
	using lines = std::vector<std::string>;

	const options plain;
	const options ignoring{true, false};
	const options counters{false, true};
}

TEST_CASE("sorts releases", "[versort]")
{
	const versort versort{plain};

	CHECK(versort.sort({"2.0.0", "1.3.0", "1.2.4", "1.2.3"}) == lines{"1.2.3", "1.2.4", "1.3.0", "2.0.0"});
	CHECK(versort.sort({"1.0.0", "1.0.0-beta", "1.0.0-alpha.1", "1.0.0-alpha"}) == lines{"1.0.0-alpha", "1.0.0-alpha.1", "1.0.0-beta", "1.0.0"});
	CHECK(versort.sort({}).empty());
}

TEST_CASE("output keeps the original text", "[versort]")
{
	const versort versort{plain};

	CHECK(versort.sort({"v2.0", " 1.10 ", "1.9+build.3"}) == lines{"1.9+build.3", " 1.10 ", "v2.0"});
}

TEST_CASE("equal versions keep input order", "[versort]")
{
	const versort versort{plain};

	CHECK(versort.sort({"1.2.0", "1.1", "1.2"}) == lines{"1.1", "1.2.0", "1.2"});
	CHECK(versort.sort({"1.2", "1.1", "1.2.0"}) == lines{"1.1", "1.2", "1.2.0"});
	CHECK(versort.sort({"1.0+b", "1.0+a", "v1.0", "1.0.0"}) == lines{"1.0+b", "1.0+a", "v1.0", "1.0.0"});
}

TEST_CASE("sorting is idempotent", "[versort]")
{
	const versort versort{plain};
	const lines input{"3.0", "1.0.0-rc.1", "0.1", "1.0", "2.5.1", "1.0.0-alpha", "2.5"};

	const auto once = versort.sort(input);

	CHECK(versort.sort(once) == once);
}

TEST_CASE("result does not depend on input permutation", "[versort]")
{
	const versort versort{plain};

	lines input{"1.0.0-alpha", "1.0.0-alpha.1", "1.0.0-beta", "1.0.0", "1.2.3", "2.0.0"};
	const auto expected = input;

	std::sort(input.begin(), input.end());

	do
	{
		CHECK(versort.sort(input) == expected);
	}
	while(std::next_permutation(input.begin(), input.end()));
}

TEST_CASE("counter ordering", "[versort][counter]")
{
	const versort versort{counters};

	CHECK(versort.sort({"1.1", "1.0b", "1.0", "1.0a"}) == lines{"1.0", "1.0a", "1.0b", "1.1"});
}

TEST_CASE("first unparsable line fails the run", "[versort]")
{
	const versort versort{plain};

	try
	{
		versort.sort({"1.0.0", "not-a-version", "2.0.0", "x"});
		FAIL("expected unparsable_line");
	}
	catch(const unparsable_line &e)
	{
		CHECK(e.line_number() == 2);
		CHECK(e.text() == "not-a-version");
		CHECK(e.reason() == parse_failure::non_numeric_segment);
		CHECK(std::string{e.what()} == "line 2: unable to parse 'not-a-version' as a version: non-numeric segment");
	}

	CHECK_THROWS_AS(versort.sort({"1.0", "", "x"}), unparsable_line);
	CHECK_THROWS_AS(versort.sort({"1.0ab"}), unparsable_line);
}

TEST_CASE("blank lines are skipped", "[versort]")
{
	const versort versort{plain};

	CHECK(versort.sort({"2.0", "", "1.0", "  "}) == lines{"1.0", "2.0"});
	CHECK(versort.sort({"", "\t"}).empty());

	try
	{
		versort.sort({"1.0", "", "bad"});
		FAIL("expected unparsable_line");
	}
	catch(const unparsable_line &e)
	{
		CHECK(e.line_number() == 3);
		CHECK(e.text() == "bad");
	}
}

TEST_CASE("ignore mode drops unparsable lines", "[versort]")
{
	const versort versort{ignoring};

	CHECK(versort.sort({"1.0.0", "not-a-version", "2.0.0"}) == lines{"1.0.0", "2.0.0"});
	CHECK(versort.sort({"", "2.0", "x.y", "1.0", "  "}) == lines{"1.0", "2.0"});
	CHECK(versort.sort({"nothing", "here"}).empty());
}

TEST_CASE("parse keeps one outcome per line", "[versort]")
{
	const versort versort{plain};

	const auto outcomes = versort.parse({"1.0", "bad", "2.0"});

	REQUIRE(outcomes.size() == 3);
	CHECK(std::holds_alternative<version>(outcomes[0]));
	CHECK(std::holds_alternative<unparsed>(outcomes[1]));
	CHECK(std::holds_alternative<version>(outcomes[2]));
}

TEST_CASE("run", "[versort][io]")
{
	std::ostringstream out;
	std::ostringstream err;

	SECTION("sorted output")
	{
		std::istringstream in{"2.0.0\r\n1.2\n1.10\n1.2.0"};

		CHECK(versort{plain}.run(in, out, err) == EXIT_SUCCESS);
		CHECK(out.str() == "1.2\n1.2.0\n1.10\n2.0.0\n");
		CHECK(err.str().empty());
	}

	SECTION("unparsable line")
	{
		std::istringstream in{"1.0.0\nnot-a-version\n2.0.0\n"};

		CHECK(versort{plain}.run(in, out, err) == EXIT_FAILURE);
		CHECK(out.str().empty());
		CHECK(err.str() == "versort: line 2: unable to parse 'not-a-version' as a version: non-numeric segment\n");
	}

	SECTION("trailing blank lines")
	{
		std::istringstream in{"2.0\n\n1.0\n   \n\n"};

		CHECK(versort{plain}.run(in, out, err) == EXIT_SUCCESS);
		CHECK(out.str() == "1.0\n2.0\n");
		CHECK(err.str().empty());
	}

	SECTION("unparsable line ignored")
	{
		std::istringstream in{"1.0.0\nnot-a-version\n2.0.0\n"};

		CHECK(versort{ignoring}.run(in, out, err) == EXIT_SUCCESS);
		CHECK(out.str() == "1.0.0\n2.0.0\n");
		CHECK(err.str().empty());
	}

	SECTION("broken output")
	{
		std::istringstream in{"1.0\n"};
		out.setstate(std::ios_base::badbit);

		CHECK(versort{plain}.run(in, out, err) == EXIT_FAILURE);
		CHECK(err.str() == "versort: unable to write output\n");
	}
}
