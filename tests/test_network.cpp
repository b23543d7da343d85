/*
Copyright (c) 2024 NSF Center for Space, High-performance, and Resilient Computing (SHREC) University of Pittsburgh. All rights reserved.

Redistribution and use in source and binary forms, with or without modification, are permitted provided that the following conditions are met:

Redistributions of source code must retain the above copyright notice, this list of conditions and the following disclaimer.
Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the following disclaimer in the documentation and/or other materials provided with the distribution.
THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS AS IS AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/
#include <catch2/catch.hpp>
#include <set>
#include "../include/SpeechNet.hpp"
#include "../include/Optimizer.hpp"
#include "test_helpers.hpp"

namespace {

NetConfig smallNet(float dropout)
{
	NetConfig cfg;

	cfg.dropout = dropout;
	cfg.seed = 21;

	return cfg;
}

} // namespace

TEST_CASE("network maps a batch of windows to class scores", "[network]")
{
	sycl::queue &q = testQueue();
	SpeechNet net(q, NetConfig());
	Tensor x = deviceTensor(2, CHANNELS, WINDOW, randomVector((size_t)2 * CHANNELS * WINDOW, 31));

	net.setMode(NetMode::Eval);
	Tensor &logits = net.forward(x);

	CHECK(logits.n == 2);
	CHECK(logits.c == CLASSES);
	CHECK(logits.l == 1);
	CHECK(net.numClasses() == CLASSES);
	CHECK(net.parameterCount() > 0);
}

TEST_CASE("parameters and state carry unique stable names", "[network]")
{
	sycl::queue &q = testQueue();
	SpeechNet net(q, NetConfig());
	set<string> names;

	for(const StateEntry &entry : net.stateEntries())
	{
		CHECK(names.insert(entry.name).second);
	}

	CHECK(names.count("stem.conv.weight") == 1);
	CHECK(names.count("stem.bn.running_mean") == 1);
	CHECK(names.count("stage1.block0.se.fc1.weight") == 1);
	CHECK(names.count("stage2.block0.shortcut.conv.weight") == 1);
	CHECK(names.count("stage1.block0.shortcut.conv.weight") == 0);
	CHECK(names.count("head.fc.bias") == 1);

	// every parameter is persisted, running statistics are state only
	CHECK(net.stateEntries().size() > net.parameters().size());
}

TEST_CASE("mode is explicit and eval is deterministic", "[network]")
{
	sycl::queue &q = testQueue();
	SpeechNet net(q, smallNet(DROPOUT));
	Tensor x = deviceTensor(3, CHANNELS, 512, randomVector((size_t)3 * CHANNELS * 512, 32));

	SECTION("training forwards differ through dropout")
	{
		net.setMode(NetMode::Train);
		vector<float> first = net.forward(x).download();
		vector<float> second = net.forward(x).download();

		CHECK(net.mode() == NetMode::Train);
		CHECK(first != second);
	}

	SECTION("eval forwards repeat exactly")
	{
		net.setMode(NetMode::Eval);
		vector<float> first = net.forward(x).download();
		vector<float> second = net.forward(x).download();

		CHECK(net.mode() == NetMode::Eval);
		CHECK(first == second);
	}

	SECTION("backward needs training mode")
	{
		net.setMode(NetMode::Eval);
		Tensor &logits = net.forward(x);
		Tensor grad = deviceTensor(logits.n, logits.c, logits.l, vector<float>(logits.size(), 0.1f));

		CHECK_THROWS_AS(net.backward(grad), EmgError);
	}
}

TEST_CASE("same seed builds the same network", "[network]")
{
	sycl::queue &q = testQueue();
	SpeechNet first(q, smallNet(0.0f)), second(q, smallNet(0.0f));
	Tensor x = deviceTensor(2, CHANNELS, 256, randomVector((size_t)2 * CHANNELS * 256, 33));

	first.setMode(NetMode::Eval);
	second.setMode(NetMode::Eval);

	CHECK(first.forward(x).download() == second.forward(x).download());
}

TEST_CASE("adam steps reduce the loss on a fixed batch", "[network][optimizer]")
{
	sycl::queue &q = testQueue();
	SpeechNet net(q, smallNet(0.0f));
	Adam adam(q, net.parameters(), LR, W_DECAY);
	Tensor x = deviceTensor(8, CHANNELS, 256, randomVector((size_t)8 * CHANNELS * 256, 34));
	Tensor targets = deviceTensor(8, 1, 1, {0, 1, 2, 3, 4, 5, 6, 7});
	Tensor losses(q, 8, 1, 1), dLogits(q, 8, CLASSES, 1);
	double initial = 0.0, last = 0.0;
	int step = 0;

	net.setMode(NetMode::Train);
	for(step = 0; step < 30; step++)
	{
		Tensor &logits = net.forward(x);
		softmaxCrossEntropy(q, logits.data(), targets.data(), losses.data(), dLogits.data(), 8, CLASSES);

		vector<float> host = losses.download();
		double mean = 0.0;
		for(float v : host)
		{
			mean += v / 8.0;
		}
		if(step == 0)
		{
			initial = mean;
		}
		last = mean;

		net.backward(dLogits);
		adam.step();
	}

	CHECK(adam.stepCount() == 30);
	CHECK(last < initial);
}

TEST_CASE("network backward gives the gradient of the mean cross-entropy", "[network][gradients]")
{
	sycl::queue &q = testQueue();
	SpeechNet net(q, smallNet(0.0f));
	Tensor x = deviceTensor(4, CHANNELS, 128, randomVector((size_t)4 * CHANNELS * 128, 35));
	Tensor targets = deviceTensor(4, 1, 1, {0, 3, 5, 9});
	Tensor losses(q, 4, 1, 1), dLogits(q, 4, CLASSES, 1);
	size_t checked = 0, matched = 0;
	const float step = 5e-3f;

	auto meanLoss = [&]() {
		Tensor &logits = net.forward(x);
		softmaxCrossEntropy(q, logits.data(), targets.data(), losses.data(), nullptr, 4, CLASSES);
		vector<float> host = losses.download();
		double mean = 0.0;
		for(float v : host)
		{
			mean += v / 4.0;
		}
		return mean;
	};

	net.setMode(NetMode::Train);
	Tensor &logits = net.forward(x);
	softmaxCrossEntropy(q, logits.data(), targets.data(), losses.data(), dLogits.data(), 4, CLASSES);
	net.backward(dLogits);

	for(Parameter *p : net.parameters())
	{
		if(p->name != "stem.conv.weight" && p->name != "stage1.block1.conv2.weight" &&
		   p->name != "stage2.block0.shortcut.conv.weight" && p->name != "stage3.block1.se.fc2.bias" &&
		   p->name != "head.fc.weight")
		{
			continue;
		}

		vector<float> grad = p->grad.download();
		vector<float> value = p->value.download();

		for(size_t i = 0; i < value.size(); i += value.size() / 4 + 1)
		{
			float original = value[i];
			double plus = 0.0, minus = 0.0, numeric = 0.0;

			value[i] = original + step;
			p->value.upload(value);
			plus = meanLoss();

			value[i] = original - step;
			p->value.upload(value);
			minus = meanLoss();

			value[i] = original;
			p->value.upload(value);

			numeric = (plus - minus) / (2.0 * step);
			checked++;
			if(grad[i] == Approx(numeric).epsilon(0.1).margin(2e-3))
			{
				matched++;
			}
		}
	}

	REQUIRE(checked >= 15);
	CHECK(matched >= checked * 4 / 5);
}

TEST_CASE("invalid network settings are rejected", "[network][errors]")
{
	sycl::queue &q = testQueue();
	NetConfig cfg;

	SECTION("single class")
	{
		cfg.numClasses = 1;
		CHECK_THROWS_AS(SpeechNet(q, cfg), ConfigError);
	}

	SECTION("dropout of one")
	{
		cfg.dropout = 1.0f;
		CHECK_THROWS_AS(SpeechNet(q, cfg), ConfigError);
	}

	SECTION("empty batch")
	{
		SpeechNet net(q, cfg);
		Tensor empty(q, 0, CHANNELS, WINDOW);

		CHECK_THROWS_AS(net.forward(empty), EmptyDatasetError);
	}
}
