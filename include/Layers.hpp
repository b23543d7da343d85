#ifndef LAYERS_H
#define LAYERS_H

#include <memory>
#include <random>
#include <sycl/sycl.hpp>
#include "host_common.hpp"
#include "kernels.hpp"
#include "Tensor.hpp"

// Train: batch statistics and active dropout, Eval: running statistics, no dropout
enum class NetMode
{
	Train,
	Eval
};

// learnable tensor and its gradient from the last backward pass
struct Parameter
{
	string name;
	Tensor value;
	Tensor grad;
};

// named tensor persisted in a checkpoint
struct StateEntry
{
	string name;
	Tensor *tensor;
};

class Conv1d
{
	private:
		sycl::queue &q;
		unsigned int inC, outC, k, stride, pad;
		bool hasBias;
		const Tensor *input;	// last forward input, needed for weight gradients
		Tensor out, dIn;

		ConvShape shape(const Tensor &x) const;

	public:
	    Parameter weight;
	    Parameter bias;

	    Conv1d(sycl::queue &q, const string &name, unsigned int inC, unsigned int outC, unsigned int k, unsigned int stride, unsigned int pad, bool hasBias, mt19937 &rng);

	    unsigned int outLength(unsigned int lin) const { return (lin + 2 * pad - k) / stride + 1; }
	    Tensor &forward(const Tensor &x);
	    // weight gradients always, input gradient only when asked
	    Tensor &backward(const Tensor &dy, bool inputGrad);
	    void collect(vector<Parameter *> &params, vector<StateEntry> &state);
};

class BatchNorm1d
{
	private:
		sycl::queue &q;
		unsigned int channels;
		Tensor mean, var;	// batch statistics of the last training forward
		Tensor xhat, out, dIn;
		bool haveBatchStats;	// backward needs a training forward first

	public:
	    Parameter gamma;
	    Parameter beta;
	    Tensor runningMean;
	    Tensor runningVar;

	    BatchNorm1d(sycl::queue &q, const string &name, unsigned int channels);

	    Tensor &forward(const Tensor &x, NetMode mode);
	    Tensor &backward(const Tensor &dy);
	    void collect(vector<Parameter *> &params, vector<StateEntry> &state);
};

class ReLU
{
	private:
		sycl::queue &q;
		Tensor out, dIn;

	public:
	    explicit ReLU(sycl::queue &q) : q(q) {}

	    Tensor &forward(const Tensor &x);
	    Tensor &backward(const Tensor &dy);
};

class MaxPool1d
{
	private:
		sycl::queue &q;
		unsigned int k, stride, pad;
		const Tensor *input;
		Tensor out, dIn;

		ConvShape shape(const Tensor &x) const;

	public:
	    MaxPool1d(sycl::queue &q, unsigned int k, unsigned int stride, unsigned int pad) : q(q), k(k), stride(stride), pad(pad), input(nullptr) {}

	    Tensor &forward(const Tensor &x);
	    Tensor &backward(const Tensor &dy);
};

// mean over time, [n, c, l] -> [n, c, 1]
class GlobalAvgPool
{
	private:
		sycl::queue &q;
		unsigned int length;
		Tensor out, dIn;

	public:
	    explicit GlobalAvgPool(sycl::queue &q) : q(q), length(0) {}

	    Tensor &forward(const Tensor &x);
	    Tensor &backward(const Tensor &dy);
};

class Dropout
{
	private:
		sycl::queue &q;
		float p;
		bool active;	// mask applied in the last forward
		Tensor mask, out, dIn;

	public:
	    Dropout(sycl::queue &q, float p) : q(q), p(p), active(false) {}

	    Tensor &forward(const Tensor &x, NetMode mode, uint32_t seed);
	    Tensor &backward(const Tensor &dy);
};

// [n, f, 1] -> [n, o, 1]
class Linear
{
	private:
		sycl::queue &q;
		unsigned int inF, outF;
		const Tensor *input;
		Tensor out, dIn;

	public:
	    Parameter weight;
	    Parameter bias;

	    Linear(sycl::queue &q, const string &name, unsigned int inF, unsigned int outF, mt19937 &rng);

	    Tensor &forward(const Tensor &x);
	    Tensor &backward(const Tensor &dy);
	    void collect(vector<Parameter *> &params, vector<StateEntry> &state);
};

// squeeze-and-excitation: pool -> fc -> relu -> fc -> sigmoid -> rescale channels
class SEGate
{
	private:
		sycl::queue &q;
		GlobalAvgPool pool;
		Linear fc1;
		ReLU relu;
		Linear fc2;
		const Tensor *input;
		Tensor gate, out, dIn, dGate, dLogit;

	public:
	    SEGate(sycl::queue &q, const string &name, unsigned int channels, unsigned int reduction, mt19937 &rng);

	    Tensor &forward(const Tensor &x);
	    Tensor &backward(const Tensor &dy);
	    void collect(vector<Parameter *> &params, vector<StateEntry> &state);
	    const Tensor &lastGate() const { return gate; }
};

// geometry of one residual block
struct BlockSpec
{
	unsigned int inC;
	unsigned int outC;
	unsigned int stride;
};

// block descriptors of one stage, the first block carries the stride and width change
vector<BlockSpec> buildStage(unsigned int inC, unsigned int outC, unsigned int blocks, unsigned int stride);

// conv-bn-relu-conv-bn-SE, plus (projected) skip, then relu and dropout
class ResidualSEBlock
{
	private:
		sycl::queue &q;
		BlockSpec spec;
		Conv1d conv1;
		BatchNorm1d bn1;
		ReLU relu1;
		Conv1d conv2;
		BatchNorm1d bn2;
		SEGate se;
		unique_ptr<Conv1d> proj;		// only when width or stride changes
		unique_ptr<BatchNorm1d> projBn;
		ReLU relu2;
		Dropout drop;
		Tensor sum, dIn;

	public:
	    ResidualSEBlock(sycl::queue &q, const string &name, const BlockSpec &spec, unsigned int reduction, float dropout, mt19937 &rng);

	    Tensor &forward(const Tensor &x, NetMode mode, uint32_t seed);
	    Tensor &backward(const Tensor &dy);
	    void collect(vector<Parameter *> &params, vector<StateEntry> &state);
	    bool projected() const { return proj != nullptr; }
	    // null for identity skips
	    Conv1d *shortcut() { return proj.get(); }
};

#endif /* LAYERS_H */
