#ifndef TEST_HELPERS_H
#define TEST_HELPERS_H

#include <cmath>
#include <filesystem>
#include <random>
#include <string>
#include <vector>
#include <sycl/sycl.hpp>
#include "../include/host_common.hpp"
#include "../include/EmgRecordingReader.hpp"
#include "../include/Tensor.hpp"

// one queue shared by every test case
sycl::queue &testQueue();

inline UtteranceWindow constantWindow(unsigned int channels, unsigned int length, float value)
{
	UtteranceWindow w;

	w.channels = channels;
	w.length = length;
	w.data.assign((size_t)channels * length, value);

	return w;
}

// sample index encoded in the value, handy for shift checks
inline UtteranceWindow rampWindow(unsigned int channels, unsigned int length)
{
	UtteranceWindow w = constantWindow(channels, length, 0.0f);

	for(unsigned int c = 0; c < channels; c++)
	{
		for(unsigned int t = 0; t < length; t++)
		{
			w.channel(c)[t] = (float)(c * 10000 + t + 1);
		}
	}

	return w;
}

inline vector<float> sine(unsigned int length, double fs, double freq, double amplitude)
{
	vector<float> out(length, 0.0f);

	for(unsigned int t = 0; t < length; t++)
	{
		out[t] = (float)(amplitude * sin(2.0 * M_PI * freq * t / fs));
	}

	return out;
}

// each class has its own set of tones per channel, plus white noise
inline Recordings syntheticRecordings(unsigned int perClass, unsigned int classes, unsigned int length, unsigned int seed)
{
	mt19937 rng(seed);
	normal_distribution<float> noise(0.0f, 0.3f);
	uniform_real_distribution<double> phase(0.0, 2.0 * M_PI);
	Recordings out;

	for(unsigned int k = 0; k < classes; k++)
	{
		for(unsigned int i = 0; i < perClass; i++)
		{
			UtteranceWindow w = constantWindow(CHANNELS, length, 0.0f);
			for(unsigned int c = 0; c < CHANNELS; c++)
			{
				double freq = 30.0 + 35.0 * k + 7.0 * c;
				double ph = phase(rng);
				for(unsigned int t = 0; t < length; t++)
				{
					w.channel(c)[t] = (float)sin(2.0 * M_PI * freq * t / 1000.0 + ph) + noise(rng);
				}
			}
			out.windows.push_back(w);
			out.labels.push_back((int)k + 1);
			out.sampleIds.push_back("synthetic:" + to_string(k) + "_" + to_string(i));
		}
	}

	return out;
}

inline vector<float> randomVector(size_t count, unsigned int seed)
{
	mt19937 rng(seed);
	uniform_real_distribution<float> dist(-1.0f, 1.0f);
	vector<float> out(count, 0.0f);

	for(float &v : out)
	{
		v = dist(rng);
	}

	return out;
}

inline Tensor deviceTensor(unsigned int n, unsigned int c, unsigned int l, const vector<float> &values)
{
	Tensor t(testQueue(), n, c, l);

	t.upload(values);

	return t;
}

inline double dot(const vector<float> &a, const vector<float> &b)
{
	double acc = 0.0;

	for(size_t i = 0; i < a.size() && i < b.size(); i++)
	{
		acc += (double)a[i] * (double)b[i];
	}

	return acc;
}

// fresh directory under the system temp dir
inline string scratchDir(const string &name)
{
	filesystem::path dir = filesystem::temp_directory_path() / ("emgspeech_" + name);

	filesystem::remove_all(dir);
	filesystem::create_directories(dir);

	return dir.string();
}

#endif /* TEST_HELPERS_H */
