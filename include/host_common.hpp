#ifndef HOST_COMMON_H
#define HOST_COMMON_H

#include <string>
#include <iostream>
#include <fstream>
#include <stdexcept>
#include <vector>
#include "common.hpp"

using namespace std;

// one utterance, channel major: data[c * length + t]
struct UtteranceWindow
{
	unsigned int channels = 0;	// number of channels
	unsigned int length = 0;	// samples per channel
	vector<float> data;			// channels * length samples

	float *channel(unsigned int c) { return data.data() + (size_t)c * length; }
	const float *channel(unsigned int c) const { return data.data() + (size_t)c * length; }
};

// base of every error raised by the pipeline
class EmgError : public runtime_error
{
	public:
		explicit EmgError(const string &what) : runtime_error(what) {}
};

// inconsistent or malformed input data
class DataIntegrityError : public EmgError
{
	public:
		explicit DataIntegrityError(const string &what) : EmgError(what) {}
};

// signal too short for the filter to settle
class FilterStabilityError : public EmgError
{
	public:
		explicit FilterStabilityError(const string &what) : EmgError(what) {}
};

// a phase produced no samples to average over
class EmptyDatasetError : public EmgError
{
	public:
		explicit EmptyDatasetError(const string &what) : EmgError(what) {}
};

// invalid option value or unknown option
class ConfigError : public EmgError
{
	public:
		explicit ConfigError(const string &what) : EmgError(what) {}
};

// checkpoint missing, malformed or for another architecture
class CheckpointError : public EmgError
{
	public:
		explicit CheckpointError(const string &what) : EmgError(what) {}
};

#endif /*HOST_COMMON_H*/
