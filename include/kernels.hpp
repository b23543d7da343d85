#ifndef KERNELS_H
#define KERNELS_H

#include <sycl/sycl.hpp>
#include <cstdint>

// 1-D convolution geometry, tensors are [n, channels, length]
struct ConvShape
{
	unsigned int n;
	unsigned int cin;
	unsigned int lin;
	unsigned int cout;
	unsigned int lout;
	unsigned int k;
	unsigned int stride;
	unsigned int pad;
};

// convolution, bias may be null
sycl::event conv1dForward(sycl::queue &q, const float *in, const float *w, const float *bias, float *out, ConvShape s);
sycl::event conv1dBackwardInput(sycl::queue &q, const float *dout, const float *w, float *din, ConvShape s);
sycl::event conv1dBackwardWeight(sycl::queue &q, const float *dout, const float *in, float *dw, float *dbias, ConvShape s);

// batch norm over (n, l) for each channel
sycl::event batchNormStats(sycl::queue &q, const float *in, float *mean, float *var, float *runningMean, float *runningVar, float momentum, unsigned int n, unsigned int c, unsigned int l);
sycl::event batchNormApply(sycl::queue &q, const float *in, const float *mean, const float *var, const float *gamma, const float *beta, float *xhat, float *out, float eps, unsigned int n, unsigned int c, unsigned int l);
sycl::event batchNormBackward(sycl::queue &q, const float *dout, const float *xhat, const float *var, const float *gamma, float *din, float *dgamma, float *dbeta, float eps, unsigned int n, unsigned int c, unsigned int l);

// elementwise
sycl::event reluForward(sycl::queue &q, const float *in, float *out, size_t count);
sycl::event reluBackward(sycl::queue &q, const float *out, const float *dout, float *din, size_t count);
sycl::event sigmoidForward(sycl::queue &q, const float *in, float *out, size_t count);
sycl::event sigmoidBackward(sycl::queue &q, const float *out, const float *dout, float *din, size_t count);
sycl::event addTensors(sycl::queue &q, const float *a, const float *b, float *out, size_t count);
sycl::event accumulate(sycl::queue &q, float *dst, const float *src, size_t count);

// inverted dropout, the mask keeps 1/(1-p) or 0 per element
sycl::event dropoutForward(sycl::queue &q, const float *in, float *mask, float *out, float p, uint32_t seed, size_t count);
sycl::event dropoutBackward(sycl::queue &q, const float *mask, const float *dout, float *din, size_t count);

// pooling over time
sycl::event maxPoolForward(sycl::queue &q, const float *in, float *out, ConvShape s);
sycl::event maxPoolBackward(sycl::queue &q, const float *in, const float *dout, float *din, ConvShape s);
sycl::event avgPoolForward(sycl::queue &q, const float *in, float *out, unsigned int n, unsigned int c, unsigned int l);
sycl::event avgPoolBackward(sycl::queue &q, const float *dout, float *din, unsigned int n, unsigned int c, unsigned int l);

// fully connected, in [n, f], w [o, f], out [n, o]
sycl::event linearForward(sycl::queue &q, const float *in, const float *w, const float *bias, float *out, unsigned int n, unsigned int f, unsigned int o);
sycl::event linearBackwardInput(sycl::queue &q, const float *dout, const float *w, float *din, unsigned int n, unsigned int f, unsigned int o);
sycl::event linearBackwardWeight(sycl::queue &q, const float *dout, const float *in, float *dw, float *dbias, unsigned int n, unsigned int f, unsigned int o);

// per (n, c) gate applied over time
sycl::event channelScaleForward(sycl::queue &q, const float *in, const float *gate, float *out, unsigned int n, unsigned int c, unsigned int l);
sycl::event channelScaleBackward(sycl::queue &q, const float *in, const float *gate, const float *dout, float *din, float *dgate, unsigned int n, unsigned int c, unsigned int l);

// per sample loss, dlogits (may be null) gets the gradient of the batch mean
sycl::event softmaxCrossEntropy(sycl::queue &q, const float *logits, const float *targets, float *loss, float *dlogits, unsigned int n, unsigned int k);

// adam with L2 decay folded into the gradient
sycl::event adamStep(sycl::queue &q, float *param, const float *grad, float *m, float *v, float lr, float beta1, float beta2, float eps, float weightDecay, float correction1, float correction2, size_t count);

#endif /* KERNELS_H */
