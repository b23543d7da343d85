#ifndef TENSOR_H
#define TENSOR_H

#include <sycl/sycl.hpp>
#include "host_common.hpp"

// owning device buffer of shape [n, c, l]
class Tensor
{
	private:
		sycl::queue *queue;
		float *buf;
		size_t count;

		void release();

	public:
	    unsigned int n, c, l;

	    Tensor();
	    Tensor(sycl::queue &q, unsigned int n, unsigned int c, unsigned int l);
	    ~Tensor();

	    Tensor(const Tensor &) = delete;
	    Tensor &operator=(const Tensor &) = delete;
	    Tensor(Tensor &&other) noexcept;
	    Tensor &operator=(Tensor &&other) noexcept;

	    // reallocates only when the element count changes, contents undefined after
	    void resize(sycl::queue &q, unsigned int n, unsigned int c, unsigned int l);

	    float *data() { return buf; }
	    const float *data() const { return buf; }
	    size_t size() const { return count; }
	    bool empty() const { return count == 0; }

	    void zero();
	    void fill(float value);
	    void upload(const float *host, size_t elements);
	    void upload(const vector<float> &host);
	    vector<float> download() const;
};

#endif /* TENSOR_H */
