#ifndef SPEECHNET_H
#define SPEECHNET_H

#include <memory>
#include <random>
#include <sycl/sycl.hpp>
#include "host_common.hpp"
#include "Config.hpp"
#include "Layers.hpp"
#include "Tensor.hpp"

#define STEM_WIDTH 16		// stem output channels
#define STAGES 3			// residual stages
#define BLOCKS 2			// residual blocks per stage

struct NetConfig
{
	unsigned int inChannels = CHANNELS;
	unsigned int numClasses = CLASSES;
	unsigned int seReduction = SE_RED;
	float dropout = DROPOUT;
	unsigned int seed = SEED;	// parameter init and dropout masks
};

NetConfig netConfig(const Config &config);

// stem -> 3 residual SE stages -> pooled linear head, [n, 4, T] -> [n, classes]
class SpeechNet
{
	private:
		sycl::queue &q;
		NetConfig cfg;
		NetMode netMode;
		mt19937 initRng;
		mt19937 dropRng;

		// stem
		Conv1d stemConv;
		BatchNorm1d stemBn;
		ReLU stemRelu;
		MaxPool1d stemPool;

		vector< unique_ptr<ResidualSEBlock>> blocks;

		// head
		GlobalAvgPool headPool;
		Dropout headDrop;
		Linear fc;

		vector<Parameter *> params;
		vector<StateEntry> state;

	public:
	    SpeechNet(sycl::queue &q, const NetConfig &config);

	    // explicit, never changed by forward or backward
	    void setMode(NetMode mode) { netMode = mode; }
	    NetMode mode() const { return netMode; }

	    Tensor &forward(const Tensor &x);
	    // gradients of every parameter from dLoss/dLogits of the last forward
	    void backward(const Tensor &dLogits);

	    const vector<Parameter *> &parameters() { return params; }
	    const vector<StateEntry> &stateEntries() { return state; }
	    size_t parameterCount() const;

	    unsigned int numClasses() const { return cfg.numClasses; }
	    sycl::queue &queue() { return q; }
};

#endif /* SPEECHNET_H */
