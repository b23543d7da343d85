/*
Copyright (c) 2024 NSF Center for Space, High-performance, and Resilient Computing (SHREC) University of Pittsburgh. All rights reserved.

Redistribution and use in source and binary forms, with or without modification, are permitted provided that the following conditions are met:

Redistributions of source code must retain the above copyright notice, this list of conditions and the following disclaimer.
Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the following disclaimer in the documentation and/or other materials provided with the distribution.
THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS AS IS AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/
#include "../include/SpeechNet.hpp"

NetConfig netConfig(const Config &config)
{
	NetConfig out;

	out.numClasses = config.numClasses;
	out.seReduction = config.seReduction;
	out.dropout = (float)config.dropout;
	out.seed = config.seed;

	return out;
}

SpeechNet::SpeechNet(sycl::queue &q, const NetConfig &config)
	: q(q), cfg(config), netMode(NetMode::Train), initRng(config.seed), dropRng(config.seed + 1),
	  stemConv(q, "stem.conv", config.inChannels, STEM_WIDTH, 7, 2, 3, false, initRng),
	  stemBn(q, "stem.bn", STEM_WIDTH),
	  stemRelu(q),
	  stemPool(q, 3, 2, 1),
	  headPool(q),
	  headDrop(q, config.dropout),
	  fc(q, "head.fc", STEM_WIDTH << (STAGES - 1), config.numClasses, initRng)
{
	unsigned int widths[STAGES + 1] = {STEM_WIDTH, STEM_WIDTH, STEM_WIDTH * 2, STEM_WIDTH * 4};
	unsigned int strides[STAGES] = {1, 2, 2};
	unsigned int s = 0, b = 0;
	vector<BlockSpec> specs;

	if(cfg.numClasses < 2)
	{
		throw ConfigError("network needs at least 2 classes");
	}
	if(cfg.dropout < 0.0f || cfg.dropout >= 1.0f)
	{
		throw ConfigError("dropout must be in [0, 1)");
	}

	for(s = 0; s < STAGES; s++)
	{
		specs = buildStage(widths[s], widths[s + 1], BLOCKS, strides[s]);
		for(b = 0; b < specs.size(); b++)
		{
			string name = "stage" + to_string(s + 1) + ".block" + to_string(b);
			blocks.push_back(unique_ptr<ResidualSEBlock>(new ResidualSEBlock(q, name, specs[b], cfg.seReduction, cfg.dropout, initRng)));
		}
	}

	// stable order, checkpoints depend on it
	stemConv.collect(params, state);
	stemBn.collect(params, state);
	for(auto &block : blocks)
	{
		block->collect(params, state);
	}
	fc.collect(params, state);

	q.wait();
}

Tensor &SpeechNet::forward(const Tensor &x)
{
	const Tensor *h = nullptr;

	if(x.c != cfg.inChannels)
	{
		throw EmgError("network expects " + to_string(cfg.inChannels) + " input channels, got " + to_string(x.c));
	}
	if(x.n == 0)
	{
		throw EmptyDatasetError("forward called with an empty batch");
	}

	Tensor &s1 = stemConv.forward(x);
	Tensor &s2 = stemBn.forward(s1, netMode);
	Tensor &s3 = stemRelu.forward(s2);
	h = &stemPool.forward(s3);

	for(auto &block : blocks)
	{
		h = &block->forward(*h, netMode, (uint32_t)dropRng());
	}

	Tensor &pooled = headPool.forward(*h);
	Tensor &dropped = headDrop.forward(pooled, netMode, (uint32_t)dropRng());

	return fc.forward(dropped);
}

void SpeechNet::backward(const Tensor &dLogits)
{
	const Tensor *g = nullptr;
	size_t i = 0;

	if(netMode != NetMode::Train)
	{
		throw EmgError("backward requires training mode");
	}

	Tensor &g1 = fc.backward(dLogits);
	Tensor &g2 = headDrop.backward(g1);
	g = &headPool.backward(g2);

	for(i = blocks.size(); i > 0; i--)
	{
		g = &blocks[i - 1]->backward(*g);
	}

	Tensor &g3 = stemPool.backward(*g);
	Tensor &g4 = stemRelu.backward(g3);
	Tensor &g5 = stemBn.backward(g4);

	// input gradient is never needed
	stemConv.backward(g5, false);
}

size_t SpeechNet::parameterCount() const
{
	size_t total = 0;

	for(const Parameter *p : params)
	{
		total += p->value.size();
	}

	return total;
}
