/*
Copyright (c) 2024 NSF Center for Space, High-performance, and Resilient Computing (SHREC) University of Pittsburgh. All rights reserved.

Redistribution and use in source and binary forms, with or without modification, are permitted provided that the following conditions are met:

Redistributions of source code must retain the above copyright notice, this list of conditions and the following disclaimer.
Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the following disclaimer in the documentation and/or other materials provided with the distribution.
THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS AS IS AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/
#include "../include/Dataset.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

void splitDataset(Recordings &all, double testFraction, unsigned int seed, Recordings &train, Recordings &test)
{
	size_t n = all.windows.size(), nTest = 0, i = 0;
	vector<size_t> order(n);
	mt19937 rng(seed);

	if(testFraction <= 0 || testFraction >= 1)
	{
		throw ConfigError("test fraction must be in (0, 1)");
	}
	if(all.labels.size() != n)
	{
		throw DataIntegrityError("split got " + to_string(n) + " windows but " + to_string(all.labels.size()) + " labels");
	}

	nTest = (size_t)ceil(testFraction * (double)n);
	if(nTest == 0 || nTest >= n)
	{
		throw ConfigError("cannot split " + to_string(n) + " windows with test fraction " + to_string(testFraction));
	}

	iota(order.begin(), order.end(), 0);
	shuffle(order.begin(), order.end(), rng);

	train = Recordings();
	test = Recordings();
	for(i = 0; i < n; i++)
	{
		Recordings &side = (i < nTest) ? test : train;

		side.windows.push_back(std::move(all.windows[order[i]]));
		side.labels.push_back(all.labels[order[i]]);
		if(order[i] < all.sampleIds.size())
		{
			side.sampleIds.push_back(all.sampleIds[order[i]]);
		}
	}

	all = Recordings();
}

BatchLoader::BatchLoader(SampleStore &store, unsigned int batchSize, bool shuffle, bool dropLast, unsigned int seed)
	: store(store), batchSize(batchSize), shuffle(shuffle), dropLast(dropLast), rng(seed)
{
	if(batchSize == 0)
	{
		throw ConfigError("batch size must be positive");
	}
}

size_t BatchLoader::startEpoch()
{
	vector<size_t> order(store.size());
	size_t start = 0, end = 0;

	iota(order.begin(), order.end(), 0);
	if(shuffle)
	{
		std::shuffle(order.begin(), order.end(), rng);
	}

	batches.clear();
	for(start = 0; start < order.size(); start += batchSize)
	{
		end = min(order.size(), start + batchSize);

		// partial trailing batch
		if(end - start < batchSize && dropLast)
		{
			break;
		}
		batches.push_back(vector<size_t>(order.begin() + start, order.begin() + end));
	}

	return batches.size();
}

Batch BatchLoader::assemble(size_t batch)
{
	const vector<size_t> &indices = batches.at(batch);
	size_t stride = (size_t)store.channels() * store.length(), i = 0;
	Batch out;

	out.n = (unsigned int)indices.size();
	out.channels = store.channels();
	out.length = store.length();
	out.inputs.resize(out.n * stride);
	out.targets.resize(out.n);

	for(i = 0; i < indices.size(); i++)
	{
		Sample sample = store.get(indices[i]);

		copy(sample.window.data.begin(), sample.window.data.end(), out.inputs.begin() + i * stride);
		out.targets[i] = sample.classIndex;
	}

	return out;
}
