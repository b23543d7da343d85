/*
Copyright (c) 2024 NSF Center for Space, High-performance, and Resilient Computing (SHREC) University of Pittsburgh. All rights reserved.

Redistribution and use in source and binary forms, with or without modification, are permitted provided that the following conditions are met:

Redistributions of source code must retain the above copyright notice, this list of conditions and the following disclaimer.
Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the following disclaimer in the documentation and/or other materials provided with the distribution.
THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS AS IS AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/
#include <catch2/catch.hpp>
#include <cmath>
#include "../include/Checkpoint.hpp"
#include "../include/Dataset.hpp"
#include "../include/Trainer.hpp"
#include "test_helpers.hpp"

namespace {

TrainerConfig quietConfig(const string &checkpointPath, unsigned int epochs)
{
	TrainerConfig cfg;

	cfg.epochs = epochs;
	cfg.checkpointPath = checkpointPath;
	cfg.verbose = false;

	return cfg;
}

} // namespace

TEST_CASE("argmax picks the first of equal scores", "[trainer]")
{
	vector<float> logits {0.1f, 0.9f, 0.3f, 2.0f, 2.0f, -1.0f};

	CHECK(argmaxRows(logits, 2, 3) == vector<int>{1, 0});
}

TEST_CASE("training run keeps the best validation checkpoint", "[trainer][slow]")
{
	sycl::queue &q = testQueue();
	string dir = scratchDir("training_run");
	string path = dir + "/models/best_model.ckpt";
	Recordings all = syntheticRecordings(10, CLASSES, WINDOW, 51), train, test;
	BandpassFilter filter(FS, LOWCUT, HIGHCUT, F_ORDER);
	double previous = -1.0;
	unsigned int improvements = 0, saved = 0;

	splitDataset(all, TEST_FRAC, SEED, train, test);
	REQUIRE(train.windows.size() == 80);
	REQUIRE(test.windows.size() == 20);

	SampleStore trainStore(std::move(train.windows), train.labels, CLASSES, &filter, AugmentConfig(), SEED);
	SampleStore valStore(std::move(test.windows), test.labels, CLASSES, &filter);
	SpeechNet net(q, NetConfig());
	Trainer trainer(q, net, quietConfig(path, 5));

	double best = trainer.fit(trainStore, valStore);
	const vector<EpochReport> &history = trainer.history();

	REQUIRE(history.size() == 5);
	CHECK(history[0].saved);
	CHECK(filesystem::exists(path));

	for(const EpochReport &report : history)
	{
		CHECK(report.train.samples == 80);
		CHECK(report.val.samples == 20);
		CHECK(std::isfinite(report.train.loss));
		CHECK(std::isfinite(report.val.loss));
		CHECK(report.val.accuracy >= 0.0);
		CHECK(report.val.accuracy <= 1.0);

		// best accuracy never decreases
		CHECK(report.bestAccuracy >= previous);

		if(report.val.accuracy > previous)
		{
			improvements++;
			previous = report.val.accuracy;
		}
		saved += report.saved ? 1 : 0;
		CHECK(report.bestAccuracy == previous);
	}

	CHECK(trainer.checkpointsWritten() == improvements);
	CHECK(saved == improvements);
	CHECK(best == previous);
	CHECK(trainer.best() == best);

	// evaluation is repeatable
	EpochMetrics first = trainer.evaluate(valStore);
	EpochMetrics second = trainer.evaluate(valStore);
	CHECK(first.loss == second.loss);
	CHECK(first.accuracy == second.accuracy);
	CHECK(net.mode() == NetMode::Eval);

	// the saved checkpoint reproduces the best accuracy
	SpeechNet restored(q, NetConfig());
	Trainer check(q, restored, quietConfig(path, 1));
	loadCheckpoint(path, restored);
	CHECK(check.evaluate(valStore).accuracy == best);
}

TEST_CASE("passes without samples are errors", "[trainer][errors]")
{
	sycl::queue &q = testQueue();
	string dir = scratchDir("empty_run");
	Recordings few = syntheticRecordings(1, 5, 256, 52);
	SampleStore small(std::move(few.windows), few.labels, CLASSES, nullptr);
	SampleStore empty(vector<UtteranceWindow>(), vector<int>(), CLASSES, nullptr);
	SpeechNet net(q, NetConfig());
	Trainer trainer(q, net, quietConfig(dir + "/model.ckpt", 1));

	SECTION("training set smaller than one batch")
	{
		BatchLoader loader(small, BATCH, true, true, SEED);

		CHECK_THROWS_AS(trainer.trainEpoch(loader), EmptyDatasetError);
	}

	SECTION("empty validation set")
	{
		CHECK_THROWS_AS(trainer.evaluate(empty), EmptyDatasetError);
		CHECK_THROWS_AS(trainer.fit(small, empty), EmptyDatasetError);
	}

	CHECK_FALSE(filesystem::exists(dir + "/model.ckpt"));
}

TEST_CASE("trainer settings are validated", "[trainer][errors]")
{
	sycl::queue &q = testQueue();
	SpeechNet net(q, NetConfig());
	TrainerConfig cfg;

	SECTION("zero batch size")
	{
		cfg.batchSize = 0;
		CHECK_THROWS_AS(Trainer(q, net, cfg), ConfigError);
	}

	SECTION("zero epochs")
	{
		cfg.epochs = 0;
		CHECK_THROWS_AS(Trainer(q, net, cfg), ConfigError);
	}

	SECTION("non-positive learning rate")
	{
		cfg.learningRate = 0.0f;
		CHECK_THROWS_AS(Trainer(q, net, cfg), ConfigError);
	}
}
