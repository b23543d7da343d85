#ifndef DATASET_H
#define DATASET_H

#include <random>
#include "host_common.hpp"
#include "EmgRecordingReader.hpp"
#include "SampleStore.hpp"

// seeded shuffle split, ceil(testFraction * n) entries go to the test side
void splitDataset(Recordings &all, double testFraction, unsigned int seed, Recordings &train, Recordings &test);

// host side batch ready for upload
struct Batch
{
	vector<float> inputs;	// [n, channels, length]
	vector<int> targets;	// zero based class indices
	unsigned int n = 0;
	unsigned int channels = 0;
	unsigned int length = 0;
};

// index batches over a sample store, shuffled or in store order
class BatchLoader
{
	private:
		SampleStore &store;
		unsigned int batchSize;
		bool shuffle;
		bool dropLast;
		mt19937 rng;
		vector< vector<size_t>> batches;

	public:
	    BatchLoader(SampleStore &store, unsigned int batchSize, bool shuffle, bool dropLast, unsigned int seed);

	    // new index order for the next pass, returns the number of batches
	    size_t startEpoch();
	    size_t batchCount() const { return batches.size(); }

	    // fetch every entry through the store, augmenting stores transform here
	    Batch assemble(size_t batch);
};

#endif /* DATASET_H */
