/*
Copyright (c) 2024 NSF Center for Space, High-performance, and Resilient Computing (SHREC) University of Pittsburgh. All rights reserved.

Redistribution and use in source and binary forms, with or without modification, are permitted provided that the following conditions are met:

Redistributions of source code must retain the above copyright notice, this list of conditions and the following disclaimer.
Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the following disclaimer in the documentation and/or other materials provided with the distribution.
THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS AS IS AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/
#include "../include/Layers.hpp"
#include <cmath>

// uniform(-bound, bound) on the host, then one copy to the device
static void initUniform(Tensor &t, float bound, mt19937 &rng)
{
	uniform_real_distribution<float> dist(-bound, bound);
	vector<float> host(t.size(), 0.0f);

	for(float &v : host)
	{
		v = dist(rng);
	}

	t.upload(host);
}

static void checkShape(const Tensor &t, unsigned int n, unsigned int c, unsigned int l, const char *where)
{
	if(t.n != n || t.c != c || t.l != l)
	{
		throw EmgError(string(where) + ": shape [" + to_string(t.n) + ", " + to_string(t.c) + ", " + to_string(t.l) + "] does not match [" + to_string(n) + ", " + to_string(c) + ", " + to_string(l) + "]");
	}
}

Conv1d::Conv1d(sycl::queue &q, const string &name, unsigned int inC, unsigned int outC, unsigned int k, unsigned int stride, unsigned int pad, bool hasBias, mt19937 &rng)
	: q(q), inC(inC), outC(outC), k(k), stride(stride), pad(pad), hasBias(hasBias), input(nullptr)
{
	float bound = 1.0f / sqrt((float)(inC * k));

	weight.name = name + ".weight";
	weight.value.resize(q, outC, inC, k);
	weight.grad.resize(q, outC, inC, k);
	initUniform(weight.value, bound, rng);
	weight.grad.zero();

	if(hasBias)
	{
		bias.name = name + ".bias";
		bias.value.resize(q, outC, 1, 1);
		bias.grad.resize(q, outC, 1, 1);
		initUniform(bias.value, bound, rng);
		bias.grad.zero();
	}
}

ConvShape Conv1d::shape(const Tensor &x) const
{
	return ConvShape{x.n, inC, x.l, outC, outLength(x.l), k, stride, pad};
}

Tensor &Conv1d::forward(const Tensor &x)
{
	if(x.c != inC)
	{
		throw EmgError(weight.name + ": expected " + to_string(inC) + " input channels, got " + to_string(x.c));
	}
	if(x.l + 2 * pad < k)
	{
		throw EmgError(weight.name + ": input of length " + to_string(x.l) + " is shorter than the kernel");
	}

	input = &x;
	out.resize(q, x.n, outC, outLength(x.l));
	conv1dForward(q, x.data(), weight.value.data(), hasBias ? bias.value.data() : nullptr, out.data(), shape(x));

	return out;
}

Tensor &Conv1d::backward(const Tensor &dy, bool inputGrad)
{
	if(input == nullptr)
	{
		throw EmgError(weight.name + ": backward before forward");
	}

	checkShape(dy, input->n, outC, outLength(input->l), weight.name.c_str());
	conv1dBackwardWeight(q, dy.data(), input->data(), weight.grad.data(), hasBias ? bias.grad.data() : nullptr, shape(*input));

	if(inputGrad)
	{
		dIn.resize(q, input->n, inC, input->l);
		conv1dBackwardInput(q, dy.data(), weight.value.data(), dIn.data(), shape(*input));
	}

	return dIn;
}

void Conv1d::collect(vector<Parameter *> &params, vector<StateEntry> &state)
{
	params.push_back(&weight);
	state.push_back(StateEntry{weight.name, &weight.value});
	if(hasBias)
	{
		params.push_back(&bias);
		state.push_back(StateEntry{bias.name, &bias.value});
	}
}

BatchNorm1d::BatchNorm1d(sycl::queue &q, const string &name, unsigned int channels)
	: q(q), channels(channels), haveBatchStats(false)
{
	mean.resize(q, channels, 1, 1);
	var.resize(q, channels, 1, 1);

	gamma.name = name + ".gamma";
	gamma.value.resize(q, channels, 1, 1);
	gamma.grad.resize(q, channels, 1, 1);
	gamma.value.fill(1.0f);
	gamma.grad.zero();

	beta.name = name + ".beta";
	beta.value.resize(q, channels, 1, 1);
	beta.grad.resize(q, channels, 1, 1);
	beta.value.zero();
	beta.grad.zero();

	runningMean.resize(q, channels, 1, 1);
	runningVar.resize(q, channels, 1, 1);
	runningMean.zero();
	runningVar.fill(1.0f);
}

Tensor &BatchNorm1d::forward(const Tensor &x, NetMode mode)
{
	if(x.c != channels)
	{
		throw EmgError(gamma.name + ": expected " + to_string(channels) + " channels, got " + to_string(x.c));
	}

	out.resize(q, x.n, x.c, x.l);

	if(mode == NetMode::Train)
	{
		xhat.resize(q, x.n, x.c, x.l);
		batchNormStats(q, x.data(), mean.data(), var.data(), runningMean.data(), runningVar.data(), (float)BN_MOM, x.n, x.c, x.l);
		batchNormApply(q, x.data(), mean.data(), var.data(), gamma.value.data(), beta.value.data(), xhat.data(), out.data(), (float)BN_EPS, x.n, x.c, x.l);
		haveBatchStats = true;
	}
	else
	{
		batchNormApply(q, x.data(), runningMean.data(), runningVar.data(), gamma.value.data(), beta.value.data(), nullptr, out.data(), (float)BN_EPS, x.n, x.c, x.l);
		haveBatchStats = false;
	}

	return out;
}

Tensor &BatchNorm1d::backward(const Tensor &dy)
{
	if(!haveBatchStats)
	{
		throw EmgError(gamma.name + ": backward needs a training mode forward");
	}

	checkShape(dy, xhat.n, xhat.c, xhat.l, gamma.name.c_str());
	dIn.resize(q, dy.n, dy.c, dy.l);
	batchNormBackward(q, dy.data(), xhat.data(), var.data(), gamma.value.data(), dIn.data(), gamma.grad.data(), beta.grad.data(), (float)BN_EPS, dy.n, dy.c, dy.l);

	return dIn;
}

void BatchNorm1d::collect(vector<Parameter *> &params, vector<StateEntry> &state)
{
	string base = gamma.name.substr(0, gamma.name.size() - 6);

	params.push_back(&gamma);
	params.push_back(&beta);
	state.push_back(StateEntry{gamma.name, &gamma.value});
	state.push_back(StateEntry{beta.name, &beta.value});
	state.push_back(StateEntry{base + ".running_mean", &runningMean});
	state.push_back(StateEntry{base + ".running_var", &runningVar});
}

Tensor &ReLU::forward(const Tensor &x)
{
	out.resize(q, x.n, x.c, x.l);
	reluForward(q, x.data(), out.data(), x.size());

	return out;
}

Tensor &ReLU::backward(const Tensor &dy)
{
	checkShape(dy, out.n, out.c, out.l, "relu");
	dIn.resize(q, dy.n, dy.c, dy.l);
	reluBackward(q, out.data(), dy.data(), dIn.data(), dy.size());

	return dIn;
}

ConvShape MaxPool1d::shape(const Tensor &x) const
{
	return ConvShape{x.n, x.c, x.l, x.c, (x.l + 2 * pad - k) / stride + 1, k, stride, pad};
}

Tensor &MaxPool1d::forward(const Tensor &x)
{
	ConvShape s = shape(x);

	if(x.l + 2 * pad < k)
	{
		throw EmgError("max pool: input of length " + to_string(x.l) + " is shorter than the window");
	}

	input = &x;
	out.resize(q, x.n, x.c, s.lout);
	maxPoolForward(q, x.data(), out.data(), s);

	return out;
}

Tensor &MaxPool1d::backward(const Tensor &dy)
{
	if(input == nullptr)
	{
		throw EmgError("max pool: backward before forward");
	}

	checkShape(dy, out.n, out.c, out.l, "max pool");
	dIn.resize(q, input->n, input->c, input->l);
	maxPoolBackward(q, input->data(), dy.data(), dIn.data(), shape(*input));

	return dIn;
}

Tensor &GlobalAvgPool::forward(const Tensor &x)
{
	length = x.l;
	out.resize(q, x.n, x.c, 1);
	avgPoolForward(q, x.data(), out.data(), x.n, x.c, x.l);

	return out;
}

Tensor &GlobalAvgPool::backward(const Tensor &dy)
{
	checkShape(dy, out.n, out.c, 1, "average pool");
	dIn.resize(q, dy.n, dy.c, length);
	avgPoolBackward(q, dy.data(), dIn.data(), dy.n, dy.c, length);

	return dIn;
}

Tensor &Dropout::forward(const Tensor &x, NetMode mode, uint32_t seed)
{
	out.resize(q, x.n, x.c, x.l);
	active = (mode == NetMode::Train && p > 0.0f);

	if(active)
	{
		mask.resize(q, x.n, x.c, x.l);
		dropoutForward(q, x.data(), mask.data(), out.data(), p, seed, x.size());
	}
	else if(x.size() > 0)
	{
		q.memcpy(out.data(), x.data(), sizeof(float) * x.size());
	}

	return out;
}

Tensor &Dropout::backward(const Tensor &dy)
{
	checkShape(dy, out.n, out.c, out.l, "dropout");
	dIn.resize(q, dy.n, dy.c, dy.l);

	if(active)
	{
		dropoutBackward(q, mask.data(), dy.data(), dIn.data(), dy.size());
	}
	else if(dy.size() > 0)
	{
		q.memcpy(dIn.data(), dy.data(), sizeof(float) * dy.size());
	}

	return dIn;
}

Linear::Linear(sycl::queue &q, const string &name, unsigned int inF, unsigned int outF, mt19937 &rng)
	: q(q), inF(inF), outF(outF), input(nullptr)
{
	float bound = 1.0f / sqrt((float)inF);

	weight.name = name + ".weight";
	weight.value.resize(q, outF, inF, 1);
	weight.grad.resize(q, outF, inF, 1);
	initUniform(weight.value, bound, rng);
	weight.grad.zero();

	bias.name = name + ".bias";
	bias.value.resize(q, outF, 1, 1);
	bias.grad.resize(q, outF, 1, 1);
	initUniform(bias.value, bound, rng);
	bias.grad.zero();
}

Tensor &Linear::forward(const Tensor &x)
{
	if(x.c * x.l != inF)
	{
		throw EmgError(weight.name + ": expected " + to_string(inF) + " features, got " + to_string(x.c * x.l));
	}

	input = &x;
	out.resize(q, x.n, outF, 1);
	linearForward(q, x.data(), weight.value.data(), bias.value.data(), out.data(), x.n, inF, outF);

	return out;
}

Tensor &Linear::backward(const Tensor &dy)
{
	if(input == nullptr)
	{
		throw EmgError(weight.name + ": backward before forward");
	}

	checkShape(dy, input->n, outF, 1, weight.name.c_str());
	linearBackwardWeight(q, dy.data(), input->data(), weight.grad.data(), bias.grad.data(), input->n, inF, outF);
	dIn.resize(q, input->n, input->c, input->l);
	linearBackwardInput(q, dy.data(), weight.value.data(), dIn.data(), input->n, inF, outF);

	return dIn;
}

void Linear::collect(vector<Parameter *> &params, vector<StateEntry> &state)
{
	params.push_back(&weight);
	params.push_back(&bias);
	state.push_back(StateEntry{weight.name, &weight.value});
	state.push_back(StateEntry{bias.name, &bias.value});
}

SEGate::SEGate(sycl::queue &q, const string &name, unsigned int channels, unsigned int reduction, mt19937 &rng)
	: q(q), pool(q), fc1(q, name + ".fc1", channels, max(1u, channels / reduction), rng), relu(q), fc2(q, name + ".fc2", max(1u, channels / reduction), channels, rng), input(nullptr)
{
}

Tensor &SEGate::forward(const Tensor &x)
{
	input = &x;

	// squeeze
	Tensor &s = pool.forward(x);

	// excitation
	Tensor &h = fc1.forward(s);
	Tensor &r = relu.forward(h);
	Tensor &z = fc2.forward(r);
	gate.resize(q, x.n, x.c, 1);
	sigmoidForward(q, z.data(), gate.data(), gate.size());

	out.resize(q, x.n, x.c, x.l);
	channelScaleForward(q, x.data(), gate.data(), out.data(), x.n, x.c, x.l);

	return out;
}

// the gate depends on the input too, so dIn sums the direct and the pooled path
Tensor &SEGate::backward(const Tensor &dy)
{
	if(input == nullptr)
	{
		throw EmgError("SE gate: backward before forward");
	}

	checkShape(dy, input->n, input->c, input->l, "SE gate");
	dIn.resize(q, dy.n, dy.c, dy.l);
	dGate.resize(q, dy.n, dy.c, 1);
	channelScaleBackward(q, input->data(), gate.data(), dy.data(), dIn.data(), dGate.data(), dy.n, dy.c, dy.l);

	dLogit.resize(q, dy.n, dy.c, 1);
	sigmoidBackward(q, gate.data(), dGate.data(), dLogit.data(), dLogit.size());

	Tensor &dr = fc2.backward(dLogit);
	Tensor &dh = relu.backward(dr);
	Tensor &ds = fc1.backward(dh);
	Tensor &dx = pool.backward(ds);
	accumulate(q, dIn.data(), dx.data(), dIn.size());

	return dIn;
}

void SEGate::collect(vector<Parameter *> &params, vector<StateEntry> &state)
{
	fc1.collect(params, state);
	fc2.collect(params, state);
}

vector<BlockSpec> buildStage(unsigned int inC, unsigned int outC, unsigned int blocks, unsigned int stride)
{
	vector<BlockSpec> specs {};
	unsigned int i = 0;

	if(blocks == 0 || stride == 0)
	{
		throw ConfigError("a stage needs at least one block and a positive stride");
	}

	specs.push_back(BlockSpec{inC, outC, stride});
	for(i = 1; i < blocks; i++)
	{
		specs.push_back(BlockSpec{outC, outC, 1});
	}

	return specs;
}

ResidualSEBlock::ResidualSEBlock(sycl::queue &q, const string &name, const BlockSpec &spec, unsigned int reduction, float dropout, mt19937 &rng)
	: q(q), spec(spec),
	  conv1(q, name + ".conv1", spec.inC, spec.outC, 3, spec.stride, 1, false, rng),
	  bn1(q, name + ".bn1", spec.outC),
	  relu1(q),
	  conv2(q, name + ".conv2", spec.outC, spec.outC, 3, 1, 1, false, rng),
	  bn2(q, name + ".bn2", spec.outC),
	  se(q, name + ".se", spec.outC, reduction, rng),
	  relu2(q),
	  drop(q, dropout)
{
	if(spec.inC != spec.outC || spec.stride != 1)
	{
		proj.reset(new Conv1d(q, name + ".shortcut.conv", spec.inC, spec.outC, 1, spec.stride, 0, false, rng));
		projBn.reset(new BatchNorm1d(q, name + ".shortcut.bn", spec.outC));
	}
}

Tensor &ResidualSEBlock::forward(const Tensor &x, NetMode mode, uint32_t seed)
{
	const Tensor *skip = &x;

	Tensor &a1 = conv1.forward(x);
	Tensor &a2 = bn1.forward(a1, mode);
	Tensor &a3 = relu1.forward(a2);
	Tensor &a4 = conv2.forward(a3);
	Tensor &a5 = bn2.forward(a4, mode);
	Tensor &a6 = se.forward(a5);

	if(proj)
	{
		Tensor &p1 = proj->forward(x);
		skip = &projBn->forward(p1, mode);
	}

	checkShape(*skip, a6.n, a6.c, a6.l, "residual add");
	sum.resize(q, a6.n, a6.c, a6.l);
	addTensors(q, a6.data(), skip->data(), sum.data(), sum.size());

	Tensor &r = relu2.forward(sum);

	return drop.forward(r, mode, seed);
}

Tensor &ResidualSEBlock::backward(const Tensor &dy)
{
	Tensor &d1 = drop.backward(dy);
	Tensor &dsum = relu2.backward(d1);

	// main path
	Tensor &g6 = se.backward(dsum);
	Tensor &g5 = bn2.backward(g6);
	Tensor &g4 = conv2.backward(g5, true);
	Tensor &g3 = relu1.backward(g4);
	Tensor &g2 = bn1.backward(g3);
	Tensor &g1 = conv1.backward(g2, true);

	dIn.resize(q, g1.n, g1.c, g1.l);
	if(proj)
	{
		Tensor &p2 = projBn->backward(dsum);
		Tensor &p1 = proj->backward(p2, true);
		addTensors(q, g1.data(), p1.data(), dIn.data(), dIn.size());
	}
	else
	{
		addTensors(q, g1.data(), dsum.data(), dIn.data(), dIn.size());
	}

	return dIn;
}

void ResidualSEBlock::collect(vector<Parameter *> &params, vector<StateEntry> &state)
{
	conv1.collect(params, state);
	bn1.collect(params, state);
	conv2.collect(params, state);
	bn2.collect(params, state);
	se.collect(params, state);
	if(proj)
	{
		proj->collect(params, state);
		projBn->collect(params, state);
	}
}
