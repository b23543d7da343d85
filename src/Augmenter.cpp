/*
Copyright (c) 2024 NSF Center for Space, High-performance, and Resilient Computing (SHREC) University of Pittsburgh. All rights reserved.

Redistribution and use in source and binary forms, with or without modification, are permitted provided that the following conditions are met:

Redistributions of source code must retain the above copyright notice, this list of conditions and the following disclaimer.
Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the following disclaimer in the documentation and/or other materials provided with the distribution.
THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS AS IS AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/
#include "../include/Augmenter.hpp"
#include <algorithm>
#include <cmath>

AugmentConfig augmentConfig(const Config &config)
{
	AugmentConfig out;

	out.maxShift = config.maxShift;
	out.noiseLevel = config.noiseLevel;
	out.scaleMin = config.scaleMin;
	out.scaleMax = config.scaleMax;
	out.offsetMin = config.offsetMin;
	out.offsetMax = config.offsetMax;

	return out;
}

Augmenter::Augmenter(const AugmentConfig &config, unsigned int seed) : cfg(config), rng(seed)
{
	if(cfg.maxShift < 0)
	{
		throw ConfigError("max shift must not be negative");
	}
	if(cfg.noiseLevel < 0)
	{
		throw ConfigError("noise level must not be negative");
	}
	if(cfg.scaleMin > cfg.scaleMax || cfg.offsetMin > cfg.offsetMax)
	{
		throw ConfigError("augmentation ranges must be ordered min <= max");
	}
}

double windowStd(const UtteranceWindow &window)
{
	double mean = 0.0, var = 0.0, d = 0.0;
	size_t count = window.data.size();

	if(count == 0)
	{
		return 0.0;
	}

	for(float v : window.data)
	{
		mean += v;
	}
	mean /= (double)count;

	for(float v : window.data)
	{
		d = v - mean;
		var += d * d;
	}

	return sqrt(var / (double)count);
}

// positive shift moves samples later in time, zeros fill the vacated edge
UtteranceWindow Augmenter::timeShift(const UtteranceWindow &window, int shift)
{
	UtteranceWindow out = window;
	unsigned int c = 0, len = window.length, mag = (unsigned int)abs(shift);
	const float *src;
	float *dst;

	if(shift == 0)
	{
		return out;
	}

	fill(out.data.begin(), out.data.end(), 0.0f);
	if(mag >= len)
	{
		return out;
	}

	for(c = 0; c < window.channels; c++)
	{
		src = window.channel(c);
		dst = out.channel(c);

		if(shift > 0)
		{
			copy(src, src + (len - mag), dst + mag);
		}
		else
		{
			copy(src + mag, src + len, dst);
		}
	}

	return out;
}

UtteranceWindow Augmenter::randomShift(const UtteranceWindow &window)
{
	uniform_int_distribution<int> shiftDist(-cfg.maxShift, cfg.maxShift);

	return timeShift(window, shiftDist(rng));
}

UtteranceWindow Augmenter::addNoise(const UtteranceWindow &window)
{
	UtteranceWindow out = window;
	double sigma = windowStd(window);

	// flat windows still get noise of the configured relative size
	if(sigma < MIN_STD)
	{
		sigma = 1.0;
	}

	if(cfg.noiseLevel == 0.0)
	{
		return out;
	}

	normal_distribution<double> noise(0.0, sigma * cfg.noiseLevel);

	for(float &v : out.data)
	{
		v = (float)(v + noise(rng));
	}

	return out;
}

UtteranceWindow Augmenter::scaleOffset(const UtteranceWindow &window, float scale, float offset)
{
	UtteranceWindow out = window;

	for(float &v : out.data)
	{
		v = v * scale + offset;
	}

	return out;
}

UtteranceWindow Augmenter::randomScaleOffset(const UtteranceWindow &window)
{
	uniform_real_distribution<double> scaleDist(cfg.scaleMin, cfg.scaleMax);
	uniform_real_distribution<double> offsetDist(cfg.offsetMin, cfg.offsetMax);
	float scale = (float)scaleDist(rng);
	float offset = (float)offsetDist(rng);

	return scaleOffset(window, scale, offset);
}

UtteranceWindow Augmenter::apply(const UtteranceWindow &window)
{
	bernoulli_distribution coin(cfg.probability);
	UtteranceWindow out = window;

	// order matters, the transforms do not commute
	if(coin(rng))
	{
		out = randomShift(out);
	}
	if(coin(rng))
	{
		out = addNoise(out);
	}
	if(coin(rng))
	{
		out = randomScaleOffset(out);
	}

	return out;
}
