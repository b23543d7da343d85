#ifndef OPTIMIZER_H
#define OPTIMIZER_H

#include <sycl/sycl.hpp>
#include "host_common.hpp"
#include "Layers.hpp"
#include "Tensor.hpp"

// adam, weight decay added to the gradient as an L2 term
class Adam
{
	private:
		sycl::queue &q;
		vector<Parameter *> params;
		vector<Tensor> m;	// first moments, one per parameter
		vector<Tensor> v;	// second moments
		unsigned long steps;
		float lr, beta1, beta2, eps, weightDecay;

	public:
	    Adam(sycl::queue &q, const vector<Parameter *> &params, float lr, float weightDecay, float beta1 = 0.9f, float beta2 = 0.999f, float eps = 1e-8f);

	    // one update from the gradients currently held by the parameters
	    void step();
	    unsigned long stepCount() const { return steps; }
};

#endif /* OPTIMIZER_H */
