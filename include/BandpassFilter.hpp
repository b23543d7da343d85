#ifndef BANDPASSFILTER_H
#define BANDPASSFILTER_H

#include <algorithm>
#include "host_common.hpp"

// zero phase butterworth bandpass, designed once per instance
class BandpassFilter
{
	private:
		vector<double> b;	// numerator coefficients
		vector<double> a;	// denominator coefficients, a[0] == 1
		vector<double> zi;	// steady state of a unit step

		void design(double fs, double lowcut, double highcut, unsigned int order);
		void steadyState();
		vector<double> lfilter(const vector<double> &x, double zScale) const;

	public:
	    BandpassFilter(double fs, double lowcut, double highcut, unsigned int order);

	    // forward-backward filtered copy, same length as the input
	    vector<float> apply(const vector<float> &signal) const;
	    void applyInPlace(float *signal, size_t length) const;

	    // samples of odd extension on each side, inputs must be longer
	    size_t padLength() const { return 3 * max(a.size(), b.size()); }

	    const vector<double> &numerator() const { return b; }
	    const vector<double> &denominator() const { return a; }
};

// one shot helper, designs and applies
vector<float> bandpassFilter(const vector<float> &signal, double fs, double lowcut, double highcut, unsigned int order);

#endif /* BANDPASSFILTER_H */
