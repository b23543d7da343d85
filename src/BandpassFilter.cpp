/*
Copyright (c) 2024 NSF Center for Space, High-performance, and Resilient Computing (SHREC) University of Pittsburgh. All rights reserved.

Redistribution and use in source and binary forms, with or without modification, are permitted provided that the following conditions are met:

Redistributions of source code must retain the above copyright notice, this list of conditions and the following disclaimer.
Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the following disclaimer in the documentation and/or other materials provided with the distribution.
THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS AS IS AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/
#include "../include/BandpassFilter.hpp"
#include <Eigen/Dense>
#include <complex>
#include <cmath>

typedef complex<double> cplx;

// expand roots into monic polynomial coefficients, highest power first
static vector<cplx> poly(const vector<cplx> &roots)
{
	vector<cplx> coeffs(1, cplx(1.0, 0.0));

	for(const cplx &r : roots)
	{
		coeffs.push_back(cplx(0.0, 0.0));
		for(size_t i = coeffs.size() - 1; i > 0; i--)
		{
			coeffs[i] -= r * coeffs[i - 1];
		}
	}

	return coeffs;
}

BandpassFilter::BandpassFilter(double fs, double lowcut, double highcut, unsigned int order)
{
	if(!(fs > 0) || !(lowcut > 0 && lowcut < highcut && highcut < fs / 2))
	{
		throw ConfigError("bandpass cutoffs must satisfy 0 < lowcut < highcut < fs/2 (got " + to_string(lowcut) + ", " + to_string(highcut) + " at fs " + to_string(fs) + ")");
	}
	if(order < 1)
	{
		throw ConfigError("bandpass order must be at least 1");
	}

	design(fs, lowcut, highcut, order);
	steadyState();
}

void BandpassFilter::design(double fs, double lowcut, double highcut, unsigned int order)
{
	int n = (int)order, m = 0;
	double nyq = fs / 2.0, wl = 0.0, wh = 0.0, bw = 0.0, wo = 0.0, gain = 0.0;
	vector<cplx> prototype {}, poles {}, zeros {};
	vector<cplx> bc, ac;
	cplx plp, root, den(1.0, 0.0);

	// pre-warp the normalized band edges for the bilinear transform (fs = 2)
	wl = 4.0 * tan(M_PI * (lowcut / nyq) / 2.0);
	wh = 4.0 * tan(M_PI * (highcut / nyq) / 2.0);
	bw = wh - wl;
	wo = sqrt(wl * wh);

	// analog butterworth prototype, unit cutoff, no zeros
	for(m = -n + 1; m < n; m += 2)
	{
		prototype.push_back(-exp(cplx(0.0, M_PI * m / (2.0 * n))));
	}

	// lowpass to bandpass, each pole splits in two
	for(const cplx &p : prototype)
	{
		plp = p * (bw / 2.0);
		root = sqrt(plp * plp - wo * wo);
		poles.push_back(plp + root);
	}
	for(const cplx &p : prototype)
	{
		plp = p * (bw / 2.0);
		root = sqrt(plp * plp - wo * wo);
		poles.push_back(plp - root);
	}
	gain = pow(bw, n);

	// bilinear transform: n zeros at the analog origin map to z = 1,
	// the remaining n go to z = -1
	for(cplx &p : poles)
	{
		den *= (4.0 - p);
		p = (4.0 + p) / (4.0 - p);
	}
	gain *= (pow(4.0, n) / den).real();

	for(m = 0; m < n; m++)
	{
		zeros.push_back(cplx(1.0, 0.0));
	}
	for(m = 0; m < n; m++)
	{
		zeros.push_back(cplx(-1.0, 0.0));
	}

	bc = poly(zeros);
	ac = poly(poles);

	b.assign(bc.size(), 0.0);
	a.assign(ac.size(), 0.0);
	for(size_t i = 0; i < bc.size(); i++)
	{
		b[i] = gain * bc[i].real();
	}
	for(size_t i = 0; i < ac.size(); i++)
	{
		a[i] = ac[i].real();
	}
}

// initial delay line state matching a unit step input, solves (I - A^T) zi = B
void BandpassFilter::steadyState()
{
	size_t n = a.size() - 1, i = 0;
	Eigen::MatrixXd iMinusA = Eigen::MatrixXd::Identity(n, n);
	Eigen::VectorXd rhs(n), sol;

	for(i = 0; i < n; i++)
	{
		iMinusA(i, 0) += a[i + 1];
		rhs(i) = b[i + 1] - a[i + 1] * b[0];
	}
	for(i = 1; i < n; i++)
	{
		iMinusA(i - 1, i) -= 1.0;
	}

	sol = iMinusA.partialPivLu().solve(rhs);

	zi.assign(n, 0.0);
	for(i = 0; i < n; i++)
	{
		zi[i] = sol(i);
	}
}

// direct form II transposed, delay line seeded with zi * zScale
vector<double> BandpassFilter::lfilter(const vector<double> &x, double zScale) const
{
	size_t n = a.size() - 1, i = 0, j = 0;
	vector<double> z(n, 0.0), y(x.size(), 0.0);
	double xi = 0.0, yi = 0.0;

	for(j = 0; j < n; j++)
	{
		z[j] = zi[j] * zScale;
	}

	for(i = 0; i < x.size(); i++)
	{
		xi = x[i];
		yi = b[0] * xi + z[0];
		for(j = 0; j + 1 < n; j++)
		{
			z[j] = b[j + 1] * xi + z[j + 1] - a[j + 1] * yi;
		}
		z[n - 1] = b[n] * xi - a[n] * yi;
		y[i] = yi;
	}

	return y;
}

void BandpassFilter::applyInPlace(float *signal, size_t length) const
{
	size_t padlen = padLength(), i = 0;
	vector<double> ext(length + 2 * padlen, 0.0), fwd, bwd;

	if(length <= padlen)
	{
		throw FilterStabilityError("signal of " + to_string(length) + " samples is too short for the bandpass filter, need more than " + to_string(padlen));
	}

	// odd extension around both end points
	for(i = 0; i < padlen; i++)
	{
		ext[i] = 2.0 * signal[0] - signal[padlen - i];
		ext[padlen + length + i] = 2.0 * signal[length - 1] - signal[length - 2 - i];
	}
	for(i = 0; i < length; i++)
	{
		ext[padlen + i] = signal[i];
	}

	// forward pass, then the same filter over the reversed output
	fwd = lfilter(ext, ext.front());
	reverse(fwd.begin(), fwd.end());
	bwd = lfilter(fwd, fwd.front());
	reverse(bwd.begin(), bwd.end());

	for(i = 0; i < length; i++)
	{
		if(!isfinite(bwd[padlen + i]))
		{
			throw FilterStabilityError("bandpass filter diverged at sample " + to_string(i));
		}
		signal[i] = (float)bwd[padlen + i];
	}
}

vector<float> BandpassFilter::apply(const vector<float> &signal) const
{
	vector<float> out(signal);

	applyInPlace(out.data(), out.size());

	return out;
}

vector<float> bandpassFilter(const vector<float> &signal, double fs, double lowcut, double highcut, unsigned int order)
{
	BandpassFilter filter(fs, lowcut, highcut, order);

	return filter.apply(signal);
}
