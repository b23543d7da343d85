/*
Copyright (c) 2024 NSF Center for Space, High-performance, and Resilient Computing (SHREC) University of Pittsburgh. All rights reserved.

Redistribution and use in source and binary forms, with or without modification, are permitted provided that the following conditions are met:

Redistributions of source code must retain the above copyright notice, this list of conditions and the following disclaimer.
Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the following disclaimer in the documentation and/or other materials provided with the distribution.
THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS AS IS AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/
#include "../include/Tensor.hpp"

Tensor::Tensor() : queue(nullptr), buf(nullptr), count(0), n(0), c(0), l(0)
{
}

Tensor::Tensor(sycl::queue &q, unsigned int n, unsigned int c, unsigned int l) : queue(nullptr), buf(nullptr), count(0), n(0), c(0), l(0)
{
	resize(q, n, c, l);
}

Tensor::~Tensor()
{
	release();
}

Tensor::Tensor(Tensor &&other) noexcept : queue(other.queue), buf(other.buf), count(other.count), n(other.n), c(other.c), l(other.l)
{
	other.buf = nullptr;
	other.count = 0;
	other.n = other.c = other.l = 0;
}

Tensor &Tensor::operator=(Tensor &&other) noexcept
{
	if(this != &other)
	{
		release();
		queue = other.queue;
		buf = other.buf;
		count = other.count;
		n = other.n;
		c = other.c;
		l = other.l;
		other.buf = nullptr;
		other.count = 0;
		other.n = other.c = other.l = 0;
	}

	return *this;
}

void Tensor::release()
{
	if(buf != nullptr)
	{
		// pending kernels may still reference the buffer
		queue->wait();
		sycl::free(buf, *queue);
		buf = nullptr;
	}
	count = 0;
}

void Tensor::resize(sycl::queue &q, unsigned int n, unsigned int c, unsigned int l)
{
	size_t wanted = (size_t)n * c * l;

	if(wanted != count || queue != &q)
	{
		release();
		queue = &q;
		if(wanted > 0)
		{
			buf = sycl::malloc_device<float>(wanted, q);
			if(buf == nullptr)
			{
				throw EmgError("device allocation of " + to_string(wanted) + " floats failed");
			}
		}
		count = wanted;
	}

	queue = &q;
	this->n = n;
	this->c = c;
	this->l = l;
}

void Tensor::zero()
{
	fill(0.0f);
}

void Tensor::fill(float value)
{
	if(count > 0)
	{
		queue->fill(buf, value, count);
	}
}

void Tensor::upload(const float *host, size_t elements)
{
	if(elements != count)
	{
		throw EmgError("upload of " + to_string(elements) + " floats into tensor of " + to_string(count));
	}
	if(count > 0)
	{
		queue->memcpy(buf, host, sizeof(float) * count).wait();
	}
}

void Tensor::upload(const vector<float> &host)
{
	upload(host.data(), host.size());
}

vector<float> Tensor::download() const
{
	vector<float> host(count, 0.0f);

	if(count > 0)
	{
		queue->memcpy(host.data(), buf, sizeof(float) * count).wait();
		queue->wait_and_throw();
	}

	return host;
}
