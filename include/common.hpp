#ifndef COMMON_H
#define COMMON_H

// compile time defaults, overridable at runtime through the config file

#define CHANNELS 4			// number of EMG channels per window
#define WINDOW 3000			// samples per utterance window
#define CLASSES 10			// number of word classes
#define FS 1000.0			// sampling rate (Hz)
#define LOWCUT 20.0			// bandpass low cutoff (Hz)
#define HIGHCUT 450.0		// bandpass high cutoff (Hz)
#define F_ORDER 4			// butterworth order
#define MAX_SHIFT 100		// max time shift for augmentation (samples)
#define NOISE_LEVEL 0.02	// additive noise, fraction of window std
#define SCALE_MIN 0.9		// scale augmentation range
#define SCALE_MAX 1.1
#define OFFSET_MIN -0.1		// offset augmentation range
#define OFFSET_MAX 0.1
#define MIN_STD 1e-6		// below this a window is treated as flat
#define BATCH 16			// training batch size
#define LR 0.001			// learning rate
#define W_DECAY 0.0001		// L2 weight decay
#define DROPOUT 0.3			// dropout probability
#define EPOCHS 50			// training epochs
#define TEST_FRAC 0.2		// validation fraction of the dataset
#define SEED 42				// shuffle / init seed
#define SE_RED 8			// squeeze-and-excitation reduction ratio
#define BN_MOM 0.1			// batch norm running stat momentum
#define BN_EPS 1e-5			// batch norm epsilon

#endif /* common */
