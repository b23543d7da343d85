#ifndef TRAINER_H
#define TRAINER_H

#include <sycl/sycl.hpp>
#include "host_common.hpp"
#include "Config.hpp"
#include "Dataset.hpp"
#include "Optimizer.hpp"
#include "SampleStore.hpp"
#include "SpeechNet.hpp"
#include "Tensor.hpp"

struct TrainerConfig
{
	unsigned int batchSize = BATCH;
	unsigned int epochs = EPOCHS;
	float learningRate = LR;
	float weightDecay = W_DECAY;
	unsigned int seed = SEED;	// shuffle order
	string checkpointPath = "models/best_model.ckpt";
	bool verbose = true;		// per epoch console report
};

TrainerConfig trainerConfig(const Config &config);

// averages over one pass
struct EpochMetrics
{
	double loss = 0.0;
	double accuracy = 0.0;
	size_t samples = 0;
};

struct EpochReport
{
	unsigned int epoch = 0;		// 1 based
	EpochMetrics train;
	EpochMetrics val;
	bool saved = false;			// checkpoint written after this epoch
	double bestAccuracy = 0.0;	// best validation accuracy so far
};

// fixed epoch budget, checkpoint on every strict validation improvement
class Trainer
{
	private:
		sycl::queue &q;
		SpeechNet &net;
		TrainerConfig cfg;
		Adam optimizer;
		double bestAccuracy;
		unsigned int checkpoints;
		vector<EpochReport> reports;
		Tensor input, targets, losses, dLogits;

		// forward (and backward + step when training) of one batch, returns correct predictions
		size_t runBatch(const Batch &batch, bool train, double &lossSum);

	public:
	    Trainer(sycl::queue &q, SpeechNet &net, const TrainerConfig &config);

	    // one shuffled pass in training mode, trailing partial batch dropped
	    EpochMetrics trainEpoch(BatchLoader &loader);

	    // one ordered pass in eval mode without gradients, every sample counted
	    EpochMetrics evaluate(SampleStore &store);

	    // returns the best validation accuracy
	    double fit(SampleStore &train, SampleStore &val);

	    double best() const { return bestAccuracy; }
	    unsigned int checkpointsWritten() const { return checkpoints; }
	    const vector<EpochReport> &history() const { return reports; }
};

// index of the highest score in each row of [n, k] logits
vector<int> argmaxRows(const vector<float> &logits, unsigned int n, unsigned int k);

#endif /* TRAINER_H */
