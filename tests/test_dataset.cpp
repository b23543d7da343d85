/*
Copyright (c) 2024 NSF Center for Space, High-performance, and Resilient Computing (SHREC) University of Pittsburgh. All rights reserved.

Redistribution and use in source and binary forms, with or without modification, are permitted provided that the following conditions are met:

Redistributions of source code must retain the above copyright notice, this list of conditions and the following disclaimer.
Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the following disclaimer in the documentation and/or other materials provided with the distribution.
THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS AS IS AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/
#include <catch2/catch.hpp>
#include <algorithm>
#include <fstream>
#include <set>
#include "../include/Dataset.hpp"
#include "../include/EmgRecordingReader.hpp"
#include "test_helpers.hpp"

namespace {

void writeFile(const string &path, const string &text)
{
	ofstream out(path);

	out << text;
	out.close();
}

const char *HEADER = "sample_id,time_index,ch1,ch2,ch3,ch4,label\n";

SampleStore storeOf(size_t count)
{
	vector<UtteranceWindow> windows;
	vector<int> labels;

	for(size_t i = 0; i < count; i++)
	{
		windows.push_back(constantWindow(CHANNELS, 8, (float)i));
		labels.push_back((int)(i % CLASSES) + 1);
	}

	return SampleStore(windows, labels, CLASSES, nullptr);
}

} // namespace

TEST_CASE("rows are grouped per sample and ordered by time", "[reader]")
{
	string dir = scratchDir("grouping");
	string file = dir + "/session.csv";

	writeFile(file, string(HEADER) +
		"b,1,10,11,12,13,2\n"
		"a,2,2.5,0,0,0,1\n"
		"b,0,0,1,2,3,2\n"
		"a,0,0.5,0,0,0,1\n"
		"a,1,1.5,0,0,0,1\n");

	EmgRecordingReader reader(file);
	Recordings rec = reader.readAll();

	REQUIRE(rec.windows.size() == 2);
	CHECK(rec.labels == vector<int>{2, 1});
	CHECK(rec.sampleIds[0] == file + ":b");

	const UtteranceWindow &b = rec.windows[0];
	REQUIRE(b.length == 2);
	CHECK(b.channel(0)[0] == 0.0f);
	CHECK(b.channel(0)[1] == 10.0f);
	CHECK(b.channel(3)[1] == 13.0f);

	const UtteranceWindow &a = rec.windows[1];
	REQUIRE(a.length == 3);
	CHECK(a.channel(0)[0] == 0.5f);
	CHECK(a.channel(0)[1] == 1.5f);
	CHECK(a.channel(0)[2] == 2.5f);
}

TEST_CASE("malformed recordings raise integrity errors", "[reader][errors]")
{
	string dir = scratchDir("malformed");
	string file = dir + "/bad.csv";

	SECTION("conflicting labels name the sample")
	{
		writeFile(file, string(HEADER) + "utt7,0,1,1,1,1,3\nutt7,1,1,1,1,1,4\n");
		EmgRecordingReader reader(file);

		CHECK_THROWS_WITH(reader.readAll(), Catch::Contains("utt7"));
	}

	SECTION("wrong field count")
	{
		writeFile(file, string(HEADER) + "utt1,0,1,1,1,3\n");
		EmgRecordingReader reader(file);

		CHECK_THROWS_AS(reader.readAll(), DataIntegrityError);
	}

	SECTION("non numeric channel")
	{
		writeFile(file, string(HEADER) + "utt1,0,1,x,1,1,3\n");
		EmgRecordingReader reader(file);

		CHECK_THROWS_AS(reader.readAll(), DataIntegrityError);
	}

	SECTION("label beyond the integer range")
	{
		writeFile(file, string(HEADER) + "utt1,0,1,1,1,1,99999999999\n");
		EmgRecordingReader reader(file);

		CHECK_THROWS_WITH(reader.readAll(), Catch::Contains("bad.csv:2") && Catch::Contains("out of range"));
	}

	SECTION("repeated time index")
	{
		writeFile(file, string(HEADER) + "utt1,0,1,1,1,1,3\nutt1,0,2,2,2,2,3\n");
		EmgRecordingReader reader(file);

		CHECK_THROWS_AS(reader.readAll(), DataIntegrityError);
	}

	SECTION("missing header")
	{
		writeFile(file, "utt1,0,1,1,1,1,3\n");
		EmgRecordingReader reader(file);

		CHECK_THROWS_AS(reader.readAll(), DataIntegrityError);
	}

	SECTION("missing file")
	{
		CHECK_THROWS_AS(EmgRecordingReader(dir + "/absent.csv"), DataIntegrityError);
	}
}

TEST_CASE("recordings are discovered recursively in path order", "[reader]")
{
	string dir = scratchDir("discover");
	string row = string(HEADER) + "s,0,1,2,3,4,1\ns,1,1,2,3,4,1\n";

	filesystem::create_directories(dir + "/subject2");
	writeFile(dir + "/subject2/b.csv", row);
	writeFile(dir + "/a.csv", row);
	writeFile(dir + "/notes.txt", "not a recording");

	vector<string> files = discoverRecordings(dir);

	REQUIRE(files.size() == 2);
	CHECK(is_sorted(files.begin(), files.end()));

	Recordings all = loadRecordings(dir, 2);
	CHECK(all.windows.size() == 2);

	CHECK_THROWS_AS(loadRecordings(dir, 3), DataIntegrityError);
	CHECK_THROWS_AS(loadRecordings(scratchDir("nothing"), 0), DataIntegrityError);
	CHECK_THROWS_AS(discoverRecordings(dir + "/absent"), DataIntegrityError);
}

TEST_CASE("split is seeded and disjoint", "[dataset]")
{
	Recordings all = syntheticRecordings(10, CLASSES, 8, 1), train, test;
	Recordings again = syntheticRecordings(10, CLASSES, 8, 1), train2, test2;
	set<string> seen;

	splitDataset(all, TEST_FRAC, SEED, train, test);
	splitDataset(again, TEST_FRAC, SEED, train2, test2);

	CHECK(train.windows.size() == 80);
	CHECK(test.windows.size() == 20);
	CHECK(train.labels.size() == 80);
	CHECK(test.sampleIds == test2.sampleIds);

	for(const string &id : train.sampleIds)
	{
		seen.insert(id);
	}
	for(const string &id : test.sampleIds)
	{
		CHECK(seen.count(id) == 0);
		seen.insert(id);
	}
	CHECK(seen.size() == 100);

	SECTION("test side is rounded up")
	{
		Recordings odd = syntheticRecordings(1, 7, 8, 1), a, b;

		splitDataset(odd, 0.2, SEED, a, b);
		CHECK(b.windows.size() == 2);
		CHECK(a.windows.size() == 5);
	}

	SECTION("a fraction outside (0, 1) is rejected")
	{
		Recordings more = syntheticRecordings(1, 4, 8, 1), a, b;

		CHECK_THROWS_AS(splitDataset(more, 1.0, SEED, a, b), ConfigError);
	}
}

TEST_CASE("batch loader drops or keeps the trailing batch", "[dataset]")
{
	SampleStore store = storeOf(37);

	SECTION("training order drops the remainder")
	{
		BatchLoader loader(store, 16, true, true, SEED);

		REQUIRE(loader.startEpoch() == 2);
		CHECK(loader.assemble(0).n == 16);
		CHECK(loader.assemble(1).n == 16);
	}

	SECTION("evaluation order keeps every sample in store order")
	{
		BatchLoader loader(store, 16, false, false, SEED);

		REQUIRE(loader.startEpoch() == 3);
		Batch last = loader.assemble(2);
		CHECK(last.n == 5);
		CHECK(last.inputs.size() == (size_t)5 * CHANNELS * 8);

		Batch first = loader.assemble(0);
		for(unsigned int b = 0; b < first.n; b++)
		{
			CHECK(first.inputs[(size_t)b * CHANNELS * 8] == (float)b);
			CHECK(first.targets[b] == (int)(b % CLASSES));
		}
	}

	SECTION("shuffled passes visit every sample once")
	{
		BatchLoader loader(store, 10, true, false, SEED);
		multiset<float> values;
		size_t batches = loader.startEpoch(), i = 0;

		for(i = 0; i < batches; i++)
		{
			Batch batch = loader.assemble(i);
			for(unsigned int b = 0; b < batch.n; b++)
			{
				values.insert(batch.inputs[(size_t)b * CHANNELS * 8]);
			}
		}

		CHECK(values.size() == 37);
		CHECK(set<float>(values.begin(), values.end()).size() == 37);
	}

	SECTION("store smaller than a batch yields nothing when dropping")
	{
		SampleStore small = storeOf(5);
		BatchLoader loader(small, 16, true, true, SEED);

		CHECK(loader.startEpoch() == 0);
	}
}
