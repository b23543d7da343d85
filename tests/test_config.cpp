/*
Copyright (c) 2024 NSF Center for Space, High-performance, and Resilient Computing (SHREC) University of Pittsburgh. All rights reserved.

Redistribution and use in source and binary forms, with or without modification, are permitted provided that the following conditions are met:

Redistributions of source code must retain the above copyright notice, this list of conditions and the following disclaimer.
Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the following disclaimer in the documentation and/or other materials provided with the distribution.
THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS AS IS AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/
#include <catch2/catch.hpp>
#include <fstream>
#include "../include/Config.hpp"
#include "../include/Trainer.hpp"
#include "test_helpers.hpp"

namespace {

string writeConfig(const string &name, const string &text)
{
	string path = scratchDir("config") + "/" + name;
	ofstream out(path);

	out << text;
	out.close();

	return path;
}

} // namespace

TEST_CASE("defaults describe the reference setup", "[config]")
{
	Config cfg;

	CHECK(cfg.fs == 1000.0);
	CHECK(cfg.lowcut == 20.0);
	CHECK(cfg.highcut == 450.0);
	CHECK(cfg.filterOrder == 4);
	CHECK(cfg.windowLength == 3000);
	CHECK(cfg.batchSize == 16);
	CHECK(cfg.numClasses == 10);
	CHECK(cfg.testFraction == 0.2);
	CHECK_NOTHROW(cfg.validate());
}

TEST_CASE("config files override defaults", "[config]")
{
	string path = writeConfig("run.csv",
		"# training run\n"
		"\n"
		"epochs, 3\n"
		"learning_rate,0.01\n"
		"checkpoint_path,out/model.ckpt\n");

	Config cfg = readConfig(path);
	TrainerConfig trainer = trainerConfig(cfg);

	CHECK(cfg.epochs == 3);
	CHECK(cfg.learningRate == 0.01);
	CHECK(cfg.checkpointPath == "out/model.ckpt");
	CHECK(cfg.batchSize == 16);
	CHECK(trainer.epochs == 3);
	CHECK(trainer.checkpointPath == "out/model.ckpt");
}

TEST_CASE("bad config entries are rejected", "[config][errors]")
{
	SECTION("unknown key")
	{
		CHECK_THROWS_AS(readConfig(writeConfig("a.csv", "learning_rat,0.1\n")), ConfigError);
	}

	SECTION("not a number")
	{
		CHECK_THROWS_AS(readConfig(writeConfig("b.csv", "epochs,many\n")), ConfigError);
	}

	SECTION("integer wider than an unsigned option")
	{
		CHECK_THROWS_AS(readConfig(writeConfig("g.csv", "epochs,99999999999\n")), ConfigError);
		CHECK_THROWS_AS(readConfig(writeConfig("h.csv", "seed,4294967296\n")), ConfigError);
		CHECK(readConfig(writeConfig("i.csv", "seed,4294967295\n")).seed == 4294967295u);
	}

	SECTION("missing value separator")
	{
		CHECK_THROWS_AS(readConfig(writeConfig("c.csv", "epochs\n")), ConfigError);
	}

	SECTION("out of range after parsing")
	{
		CHECK_THROWS_AS(readConfig(writeConfig("d.csv", "lowcut,500\n")), ConfigError);
		CHECK_THROWS_AS(readConfig(writeConfig("e.csv", "test_fraction,1.5\n")), ConfigError);
		CHECK_THROWS_AS(readConfig(writeConfig("f.csv", "dropout,1\n")), ConfigError);
	}

	SECTION("missing file")
	{
		CHECK_THROWS_AS(readConfig("/nonexistent/emgspeech.csv"), ConfigError);
	}
}
