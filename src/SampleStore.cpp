/*
Copyright (c) 2024 NSF Center for Space, High-performance, and Resilient Computing (SHREC) University of Pittsburgh. All rights reserved.

Redistribution and use in source and binary forms, with or without modification, are permitted provided that the following conditions are met:

Redistributions of source code must retain the above copyright notice, this list of conditions and the following disclaimer.
Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the following disclaimer in the documentation and/or other materials provided with the distribution.
THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS AS IS AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/
#include "../include/SampleStore.hpp"

SampleStore::SampleStore(vector<UtteranceWindow> raw, const vector<int> &labels, unsigned int numClasses, const BandpassFilter *filter)
	: windows(std::move(raw)), nChannels(0), nLength(0)
{
	build(labels, numClasses, filter);
}

SampleStore::SampleStore(vector<UtteranceWindow> raw, const vector<int> &labels, unsigned int numClasses, const BandpassFilter *filter, const AugmentConfig &augment, unsigned int seed)
	: windows(std::move(raw)), nChannels(0), nLength(0)
{
	build(labels, numClasses, filter);
	augmenter.reset(new Augmenter(augment, seed));
}

void SampleStore::build(const vector<int> &labels, unsigned int numClasses, const BandpassFilter *filter)
{
	size_t i = 0;
	unsigned int c = 0;

	if(windows.size() != labels.size())
	{
		throw DataIntegrityError("sample store got " + to_string(windows.size()) + " windows but " + to_string(labels.size()) + " labels");
	}

	if(!windows.empty())
	{
		nChannels = windows[0].channels;
		nLength = windows[0].length;
	}

	classes.resize(labels.size());
	for(i = 0; i < windows.size(); i++)
	{
		UtteranceWindow &w = windows[i];

		if(w.channels != CHANNELS || w.channels != nChannels)
		{
			throw DataIntegrityError("window " + to_string(i) + " has " + to_string(w.channels) + " channels, expected " + to_string(CHANNELS));
		}
		if(w.length != nLength || w.data.size() != (size_t)w.channels * w.length)
		{
			throw DataIntegrityError("window " + to_string(i) + " has length " + to_string(w.length) + ", expected " + to_string(nLength));
		}
		if(labels[i] < 1 || labels[i] > (int)numClasses)
		{
			throw DataIntegrityError("window " + to_string(i) + " has label " + to_string(labels[i]) + " outside [1, " + to_string(numClasses) + "]");
		}

		// labels are stored zero based from here on
		classes[i] = labels[i] - 1;

		if(filter != nullptr)
		{
			for(c = 0; c < w.channels; c++)
			{
				filter->applyInPlace(w.channel(c), w.length);
			}
		}
	}
}

Sample SampleStore::get(size_t index)
{
	if(index >= windows.size())
	{
		throw out_of_range("sample index " + to_string(index) + " out of range for store of " + to_string(windows.size()));
	}

	if(augmenter)
	{
		return Sample{augmenter->apply(windows[index]), classes[index]};
	}

	return Sample{windows[index], classes[index]};
}

const UtteranceWindow &SampleStore::window(size_t index) const
{
	return windows.at(index);
}

int SampleStore::classIndex(size_t index) const
{
	return classes.at(index);
}
