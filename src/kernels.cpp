/*
Copyright (c) 2024 NSF Center for Space, High-performance, and Resilient Computing (SHREC) University of Pittsburgh. All rights reserved.

Redistribution and use in source and binary forms, with or without modification, are permitted provided that the following conditions are met:

Redistributions of source code must retain the above copyright notice, this list of conditions and the following disclaimer.
Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the following disclaimer in the documentation and/or other materials provided with the distribution.
THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS AS IS AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/
#include <sycl/sycl.hpp>
#include <cmath>
#include "../include/kernels.hpp"

class conv1d_forward_kernel;
class conv1d_backward_input_kernel;
class conv1d_backward_weight_kernel;
class conv1d_backward_bias_kernel;
class bn_stats_kernel;
class bn_apply_kernel;
class bn_reduce_kernel;
class bn_backward_kernel;
class relu_forward_kernel;
class relu_backward_kernel;
class sigmoid_forward_kernel;
class sigmoid_backward_kernel;
class add_kernel;
class accumulate_kernel;
class dropout_forward_kernel;
class dropout_backward_kernel;
class maxpool_forward_kernel;
class maxpool_backward_kernel;
class avgpool_forward_kernel;
class avgpool_backward_kernel;
class linear_forward_kernel;
class linear_backward_input_kernel;
class linear_backward_weight_kernel;
class channel_scale_forward_kernel;
class channel_scale_backward_input_kernel;
class channel_scale_backward_gate_kernel;
class softmax_ce_kernel;
class adam_kernel;

sycl::event conv1dForward(sycl::queue &q, const float *in, const float *w, const float *bias, float *out, ConvShape s)
{
    size_t total = (size_t)s.n * s.cout * s.lout;

    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<conv1d_forward_kernel>(sycl::range<1>(total), [=](sycl::id<1> idx) {
            size_t i = idx[0];
            unsigned int l = i % s.lout;
            unsigned int co = (i / s.lout) % s.cout;
            unsigned int b = i / ((size_t)s.lout * s.cout);
            float acc = (bias != nullptr) ? bias[co] : 0.0f;
            int x = 0;

            for(unsigned int ci = 0; ci < s.cin; ci++)
            {
                const float *src = in + ((size_t)b * s.cin + ci) * s.lin;
                const float *wk = w + ((size_t)co * s.cin + ci) * s.k;

                for(unsigned int k = 0; k < s.k; k++)
                {
                    x = (int)(l * s.stride + k) - (int)s.pad;
                    if(x >= 0 && x < (int)s.lin)
                    {
                        acc += wk[k] * src[x];
                    }
                }
            }

            out[i] = acc;
        });
    });
}

// gather form, each input element sums the outputs it contributed to
sycl::event conv1dBackwardInput(sycl::queue &q, const float *dout, const float *w, float *din, ConvShape s)
{
    size_t total = (size_t)s.n * s.cin * s.lin;

    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<conv1d_backward_input_kernel>(sycl::range<1>(total), [=](sycl::id<1> idx) {
            size_t i = idx[0];
            int x = (int)(i % s.lin);
            unsigned int ci = (i / s.lin) % s.cin;
            unsigned int b = i / ((size_t)s.lin * s.cin);
            float acc = 0.0f;
            int t = 0, l = 0;

            for(unsigned int co = 0; co < s.cout; co++)
            {
                const float *grad = dout + ((size_t)b * s.cout + co) * s.lout;
                const float *wk = w + ((size_t)co * s.cin + ci) * s.k;

                for(unsigned int k = 0; k < s.k; k++)
                {
                    t = x + (int)s.pad - (int)k;
                    if(t < 0 || t % (int)s.stride != 0)
                    {
                        continue;
                    }
                    l = t / (int)s.stride;
                    if(l < (int)s.lout)
                    {
                        acc += wk[k] * grad[l];
                    }
                }
            }

            din[i] = acc;
        });
    });
}

sycl::event conv1dBackwardWeight(sycl::queue &q, const float *dout, const float *in, float *dw, float *dbias, ConvShape s)
{
    size_t total = (size_t)s.cout * s.cin * s.k;
    sycl::event e;

    e = q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<conv1d_backward_weight_kernel>(sycl::range<1>(total), [=](sycl::id<1> idx) {
            size_t i = idx[0];
            unsigned int k = i % s.k;
            unsigned int ci = (i / s.k) % s.cin;
            unsigned int co = i / ((size_t)s.k * s.cin);
            float acc = 0.0f;
            int x = 0;

            for(unsigned int b = 0; b < s.n; b++)
            {
                const float *grad = dout + ((size_t)b * s.cout + co) * s.lout;
                const float *src = in + ((size_t)b * s.cin + ci) * s.lin;

                for(unsigned int l = 0; l < s.lout; l++)
                {
                    x = (int)(l * s.stride + k) - (int)s.pad;
                    if(x >= 0 && x < (int)s.lin)
                    {
                        acc += grad[l] * src[x];
                    }
                }
            }

            dw[i] = acc;
        });
    });

    if(dbias == nullptr)
    {
        return e;
    }

    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<conv1d_backward_bias_kernel>(sycl::range<1>(s.cout), [=](sycl::id<1> idx) {
            unsigned int co = idx[0];
            float acc = 0.0f;

            for(unsigned int b = 0; b < s.n; b++)
            {
                const float *grad = dout + ((size_t)b * s.cout + co) * s.lout;
                for(unsigned int l = 0; l < s.lout; l++)
                {
                    acc += grad[l];
                }
            }

            dbias[co] = acc;
        });
    });
}

// biased batch variance for normalizing, unbiased for the running estimate
sycl::event batchNormStats(sycl::queue &q, const float *in, float *mean, float *var, float *runningMean, float *runningVar, float momentum, unsigned int n, unsigned int c, unsigned int l)
{
    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<bn_stats_kernel>(sycl::range<1>(c), [=](sycl::id<1> idx) {
            unsigned int ch = idx[0];
            size_t m = (size_t)n * l;
            float sum = 0.0f, sq = 0.0f, d = 0.0f, mu = 0.0f, sigma2 = 0.0f;

            for(unsigned int b = 0; b < n; b++)
            {
                const float *src = in + ((size_t)b * c + ch) * l;
                for(unsigned int t = 0; t < l; t++)
                {
                    sum += src[t];
                }
            }
            mu = sum / (float)m;

            for(unsigned int b = 0; b < n; b++)
            {
                const float *src = in + ((size_t)b * c + ch) * l;
                for(unsigned int t = 0; t < l; t++)
                {
                    d = src[t] - mu;
                    sq += d * d;
                }
            }
            sigma2 = sq / (float)m;

            mean[ch] = mu;
            var[ch] = sigma2;
            runningMean[ch] = (1.0f - momentum) * runningMean[ch] + momentum * mu;
            runningVar[ch] = (1.0f - momentum) * runningVar[ch] + momentum * (m > 1 ? sq / (float)(m - 1) : sigma2);
        });
    });
}

sycl::event batchNormApply(sycl::queue &q, const float *in, const float *mean, const float *var, const float *gamma, const float *beta, float *xhat, float *out, float eps, unsigned int n, unsigned int c, unsigned int l)
{
    size_t total = (size_t)n * c * l;

    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<bn_apply_kernel>(sycl::range<1>(total), [=](sycl::id<1> idx) {
            size_t i = idx[0];
            unsigned int ch = (i / l) % c;
            float norm = (in[i] - mean[ch]) / sycl::sqrt(var[ch] + eps);

            if(xhat != nullptr)
            {
                xhat[i] = norm;
            }
            out[i] = gamma[ch] * norm + beta[ch];
        });
    });
}

sycl::event batchNormBackward(sycl::queue &q, const float *dout, const float *xhat, const float *var, const float *gamma, float *din, float *dgamma, float *dbeta, float eps, unsigned int n, unsigned int c, unsigned int l)
{
    size_t total = (size_t)n * c * l;
    float m = (float)((size_t)n * l);

    q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<bn_reduce_kernel>(sycl::range<1>(c), [=](sycl::id<1> idx) {
            unsigned int ch = idx[0];
            float dg = 0.0f, db = 0.0f;

            for(unsigned int b = 0; b < n; b++)
            {
                size_t base = ((size_t)b * c + ch) * l;
                for(unsigned int t = 0; t < l; t++)
                {
                    dg += dout[base + t] * xhat[base + t];
                    db += dout[base + t];
                }
            }

            dgamma[ch] = dg;
            dbeta[ch] = db;
        });
    });

    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<bn_backward_kernel>(sycl::range<1>(total), [=](sycl::id<1> idx) {
            size_t i = idx[0];
            unsigned int ch = (i / l) % c;
            float invstd = 1.0f / sycl::sqrt(var[ch] + eps);

            din[i] = gamma[ch] * invstd / m * (m * dout[i] - dbeta[ch] - xhat[i] * dgamma[ch]);
        });
    });
}

sycl::event reluForward(sycl::queue &q, const float *in, float *out, size_t count)
{
    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<relu_forward_kernel>(sycl::range<1>(count), [=](sycl::id<1> idx) {
            out[idx] = in[idx] > 0.0f ? in[idx] : 0.0f;
        });
    });
}

sycl::event reluBackward(sycl::queue &q, const float *out, const float *dout, float *din, size_t count)
{
    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<relu_backward_kernel>(sycl::range<1>(count), [=](sycl::id<1> idx) {
            din[idx] = out[idx] > 0.0f ? dout[idx] : 0.0f;
        });
    });
}

sycl::event sigmoidForward(sycl::queue &q, const float *in, float *out, size_t count)
{
    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<sigmoid_forward_kernel>(sycl::range<1>(count), [=](sycl::id<1> idx) {
            out[idx] = 1.0f / (1.0f + sycl::exp(-in[idx]));
        });
    });
}

sycl::event sigmoidBackward(sycl::queue &q, const float *out, const float *dout, float *din, size_t count)
{
    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<sigmoid_backward_kernel>(sycl::range<1>(count), [=](sycl::id<1> idx) {
            din[idx] = dout[idx] * out[idx] * (1.0f - out[idx]);
        });
    });
}

sycl::event addTensors(sycl::queue &q, const float *a, const float *b, float *out, size_t count)
{
    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<add_kernel>(sycl::range<1>(count), [=](sycl::id<1> idx) {
            out[idx] = a[idx] + b[idx];
        });
    });
}

sycl::event accumulate(sycl::queue &q, float *dst, const float *src, size_t count)
{
    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<accumulate_kernel>(sycl::range<1>(count), [=](sycl::id<1> idx) {
            dst[idx] += src[idx];
        });
    });
}

sycl::event dropoutForward(sycl::queue &q, const float *in, float *mask, float *out, float p, uint32_t seed, size_t count)
{
    float keep = 1.0f / (1.0f - p);

    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<dropout_forward_kernel>(sycl::range<1>(count), [=](sycl::id<1> idx) {
            // integer hash of (seed, index) -> uniform [0, 1)
            uint32_t h = (uint32_t)idx[0] * 0x9E3779B1u ^ seed;
            h ^= h >> 16;
            h *= 0x7FEB352Du;
            h ^= h >> 15;
            h *= 0x846CA68Bu;
            h ^= h >> 16;
            float u = (float)(h >> 8) * (1.0f / 16777216.0f);
            float scale = (u >= p) ? keep : 0.0f;

            mask[idx] = scale;
            out[idx] = in[idx] * scale;
        });
    });
}

sycl::event dropoutBackward(sycl::queue &q, const float *mask, const float *dout, float *din, size_t count)
{
    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<dropout_backward_kernel>(sycl::range<1>(count), [=](sycl::id<1> idx) {
            din[idx] = dout[idx] * mask[idx];
        });
    });
}

// padded positions never win, ties go to the earliest position
sycl::event maxPoolForward(sycl::queue &q, const float *in, float *out, ConvShape s)
{
    size_t total = (size_t)s.n * s.cout * s.lout;

    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<maxpool_forward_kernel>(sycl::range<1>(total), [=](sycl::id<1> idx) {
            size_t i = idx[0];
            unsigned int l = i % s.lout;
            size_t row = i / s.lout;
            const float *src = in + row * s.lin;
            float best = -INFINITY;
            int x = 0;

            for(unsigned int k = 0; k < s.k; k++)
            {
                x = (int)(l * s.stride + k) - (int)s.pad;
                if(x >= 0 && x < (int)s.lin && src[x] > best)
                {
                    best = src[x];
                }
            }

            out[i] = best;
        });
    });
}

sycl::event maxPoolBackward(sycl::queue &q, const float *in, const float *dout, float *din, ConvShape s)
{
    size_t total = (size_t)s.n * s.cin * s.lin;

    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<maxpool_backward_kernel>(sycl::range<1>(total), [=](sycl::id<1> idx) {
            size_t i = idx[0];
            int x = (int)(i % s.lin);
            size_t row = i / s.lin;
            const float *src = in + row * s.lin;
            const float *grad = dout + row * s.lout;
            float acc = 0.0f, best = 0.0f;
            int t = 0, l = 0, pos = 0, arg = 0;

            for(unsigned int k = 0; k < s.k; k++)
            {
                t = x + (int)s.pad - (int)k;
                if(t < 0 || t % (int)s.stride != 0)
                {
                    continue;
                }
                l = t / (int)s.stride;
                if(l >= (int)s.lout)
                {
                    continue;
                }

                // recompute the winner of window l
                best = -INFINITY;
                arg = -1;
                for(unsigned int kk = 0; kk < s.k; kk++)
                {
                    pos = l * (int)s.stride + (int)kk - (int)s.pad;
                    if(pos >= 0 && pos < (int)s.lin && src[pos] > best)
                    {
                        best = src[pos];
                        arg = pos;
                    }
                }

                if(arg == x)
                {
                    acc += grad[l];
                }
            }

            din[i] = acc;
        });
    });
}

sycl::event avgPoolForward(sycl::queue &q, const float *in, float *out, unsigned int n, unsigned int c, unsigned int l)
{
    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<avgpool_forward_kernel>(sycl::range<1>((size_t)n * c), [=](sycl::id<1> idx) {
            const float *src = in + idx[0] * l;
            float acc = 0.0f;

            for(unsigned int t = 0; t < l; t++)
            {
                acc += src[t];
            }

            out[idx] = acc / (float)l;
        });
    });
}

sycl::event avgPoolBackward(sycl::queue &q, const float *dout, float *din, unsigned int n, unsigned int c, unsigned int l)
{
    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<avgpool_backward_kernel>(sycl::range<1>((size_t)n * c * l), [=](sycl::id<1> idx) {
            din[idx] = dout[idx[0] / l] / (float)l;
        });
    });
}

sycl::event linearForward(sycl::queue &q, const float *in, const float *w, const float *bias, float *out, unsigned int n, unsigned int f, unsigned int o)
{
    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<linear_forward_kernel>(sycl::range<1>((size_t)n * o), [=](sycl::id<1> idx) {
            unsigned int j = idx[0] % o;
            unsigned int b = idx[0] / o;
            float acc = (bias != nullptr) ? bias[j] : 0.0f;

            for(unsigned int i = 0; i < f; i++)
            {
                acc += w[(size_t)j * f + i] * in[(size_t)b * f + i];
            }

            out[idx] = acc;
        });
    });
}

sycl::event linearBackwardInput(sycl::queue &q, const float *dout, const float *w, float *din, unsigned int n, unsigned int f, unsigned int o)
{
    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<linear_backward_input_kernel>(sycl::range<1>((size_t)n * f), [=](sycl::id<1> idx) {
            unsigned int i = idx[0] % f;
            unsigned int b = idx[0] / f;
            float acc = 0.0f;

            for(unsigned int j = 0; j < o; j++)
            {
                acc += w[(size_t)j * f + i] * dout[(size_t)b * o + j];
            }

            din[idx] = acc;
        });
    });
}

sycl::event linearBackwardWeight(sycl::queue &q, const float *dout, const float *in, float *dw, float *dbias, unsigned int n, unsigned int f, unsigned int o)
{
    sycl::event e;

    e = q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<linear_backward_weight_kernel>(sycl::range<1>((size_t)o * f), [=](sycl::id<1> idx) {
            unsigned int i = idx[0] % f;
            unsigned int j = idx[0] / f;
            float acc = 0.0f;

            for(unsigned int b = 0; b < n; b++)
            {
                acc += dout[(size_t)b * o + j] * in[(size_t)b * f + i];
            }

            dw[idx] = acc;
            if(dbias != nullptr && i == 0)
            {
                float db = 0.0f;
                for(unsigned int b = 0; b < n; b++)
                {
                    db += dout[(size_t)b * o + j];
                }
                dbias[j] = db;
            }
        });
    });

    return e;
}

sycl::event channelScaleForward(sycl::queue &q, const float *in, const float *gate, float *out, unsigned int n, unsigned int c, unsigned int l)
{
    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<channel_scale_forward_kernel>(sycl::range<1>((size_t)n * c * l), [=](sycl::id<1> idx) {
            out[idx] = in[idx] * gate[idx[0] / l];
        });
    });
}

sycl::event channelScaleBackward(sycl::queue &q, const float *in, const float *gate, const float *dout, float *din, float *dgate, unsigned int n, unsigned int c, unsigned int l)
{
    q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<channel_scale_backward_input_kernel>(sycl::range<1>((size_t)n * c * l), [=](sycl::id<1> idx) {
            din[idx] = dout[idx] * gate[idx[0] / l];
        });
    });

    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<channel_scale_backward_gate_kernel>(sycl::range<1>((size_t)n * c), [=](sycl::id<1> idx) {
            size_t base = idx[0] * l;
            float acc = 0.0f;

            for(unsigned int t = 0; t < l; t++)
            {
                acc += dout[base + t] * in[base + t];
            }

            dgate[idx] = acc;
        });
    });
}

sycl::event softmaxCrossEntropy(sycl::queue &q, const float *logits, const float *targets, float *loss, float *dlogits, unsigned int n, unsigned int k)
{
    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<softmax_ce_kernel>(sycl::range<1>(n), [=](sycl::id<1> idx) {
            unsigned int b = idx[0];
            const float *row = logits + (size_t)b * k;
            unsigned int target = (unsigned int)targets[b];
            float top = row[0], sum = 0.0f, lse = 0.0f;

            for(unsigned int j = 1; j < k; j++)
            {
                top = sycl::fmax(top, row[j]);
            }
            for(unsigned int j = 0; j < k; j++)
            {
                sum += sycl::exp(row[j] - top);
            }
            lse = top + sycl::log(sum);

            loss[b] = lse - row[target];

            if(dlogits != nullptr)
            {
                for(unsigned int j = 0; j < k; j++)
                {
                    dlogits[(size_t)b * k + j] = (sycl::exp(row[j] - lse) - (j == target ? 1.0f : 0.0f)) / (float)n;
                }
            }
        });
    });
}

sycl::event adamStep(sycl::queue &q, float *param, const float *grad, float *m, float *v, float lr, float beta1, float beta2, float eps, float weightDecay, float correction1, float correction2, size_t count)
{
    return q.submit([&](sycl::handler &cgh) {
        cgh.parallel_for<adam_kernel>(sycl::range<1>(count), [=](sycl::id<1> idx) {
            float g = grad[idx] + weightDecay * param[idx];
            float mt = beta1 * m[idx] + (1.0f - beta1) * g;
            float vt = beta2 * v[idx] + (1.0f - beta2) * g * g;

            m[idx] = mt;
            v[idx] = vt;
            param[idx] -= lr * (mt / correction1) / (sycl::sqrt(vt / correction2) + eps);
        });
    });
}
