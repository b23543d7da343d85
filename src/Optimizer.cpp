/*
Copyright (c) 2024 NSF Center for Space, High-performance, and Resilient Computing (SHREC) University of Pittsburgh. All rights reserved.

Redistribution and use in source and binary forms, with or without modification, are permitted provided that the following conditions are met:

Redistributions of source code must retain the above copyright notice, this list of conditions and the following disclaimer.
Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the following disclaimer in the documentation and/or other materials provided with the distribution.
THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS AS IS AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/
#include "../include/Optimizer.hpp"
#include <cmath>

Adam::Adam(sycl::queue &q, const vector<Parameter *> &params, float lr, float weightDecay, float beta1, float beta2, float eps)
	: q(q), params(params), steps(0), lr(lr), beta1(beta1), beta2(beta2), eps(eps), weightDecay(weightDecay)
{
	if(lr <= 0.0f || weightDecay < 0.0f)
	{
		throw ConfigError("adam needs a positive learning rate and non-negative weight decay");
	}

	for(Parameter *p : this->params)
	{
		m.push_back(Tensor(q, p->value.n, p->value.c, p->value.l));
		v.push_back(Tensor(q, p->value.n, p->value.c, p->value.l));
		m.back().zero();
		v.back().zero();
	}
}

void Adam::step()
{
	size_t i = 0;
	float correction1 = 0.0f, correction2 = 0.0f;

	steps++;
	correction1 = 1.0f - pow(beta1, (float)steps);
	correction2 = 1.0f - pow(beta2, (float)steps);

	for(i = 0; i < params.size(); i++)
	{
		adamStep(q, params[i]->value.data(), params[i]->grad.data(), m[i].data(), v[i].data(), lr, beta1, beta2, eps, weightDecay, correction1, correction2, params[i]->value.size());
	}
}
