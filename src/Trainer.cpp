/*
Copyright (c) 2024 NSF Center for Space, High-performance, and Resilient Computing (SHREC) University of Pittsburgh. All rights reserved.

Redistribution and use in source and binary forms, with or without modification, are permitted provided that the following conditions are met:

Redistributions of source code must retain the above copyright notice, this list of conditions and the following disclaimer.
Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the following disclaimer in the documentation and/or other materials provided with the distribution.
THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS AS IS AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/
#include "../include/Trainer.hpp"
#include "../include/Checkpoint.hpp"
#include <chrono>
#include <cmath>
#include <iomanip>

TrainerConfig trainerConfig(const Config &config)
{
	TrainerConfig out;

	out.batchSize = config.batchSize;
	out.epochs = config.epochs;
	out.learningRate = (float)config.learningRate;
	out.weightDecay = (float)config.weightDecay;
	out.seed = config.seed;
	out.checkpointPath = config.checkpointPath;

	return out;
}

vector<int> argmaxRows(const vector<float> &logits, unsigned int n, unsigned int k)
{
	vector<int> out(n, 0);
	unsigned int b = 0, j = 0;

	for(b = 0; b < n; b++)
	{
		for(j = 1; j < k; j++)
		{
			if(logits[(size_t)b * k + j] > logits[(size_t)b * k + out[b]])
			{
				out[b] = (int)j;
			}
		}
	}

	return out;
}

Trainer::Trainer(sycl::queue &q, SpeechNet &net, const TrainerConfig &config)
	: q(q), net(net), cfg(config), optimizer(q, net.parameters(), config.learningRate, config.weightDecay), bestAccuracy(-1.0), checkpoints(0)
{
	if(cfg.batchSize == 0 || cfg.epochs == 0)
	{
		throw ConfigError("trainer needs a positive batch size and epoch count");
	}
}

size_t Trainer::runBatch(const Batch &batch, bool train, double &lossSum)
{
	unsigned int k = net.numClasses(), b = 0;
	vector<float> hostTargets(batch.n, 0.0f), hostLoss, hostLogits;
	vector<int> predicted;
	size_t correct = 0;

	for(b = 0; b < batch.n; b++)
	{
		hostTargets[b] = (float)batch.targets[b];
	}

	input.resize(q, batch.n, batch.channels, batch.length);
	input.upload(batch.inputs);
	targets.resize(q, batch.n, 1, 1);
	targets.upload(hostTargets);
	losses.resize(q, batch.n, 1, 1);

	Tensor &logits = net.forward(input);

	if(train)
	{
		dLogits.resize(q, batch.n, k, 1);
		softmaxCrossEntropy(q, logits.data(), targets.data(), losses.data(), dLogits.data(), batch.n, k);
		net.backward(dLogits);
		optimizer.step();
	}
	else
	{
		softmaxCrossEntropy(q, logits.data(), targets.data(), losses.data(), nullptr, batch.n, k);
	}

	hostLoss = losses.download();
	hostLogits = logits.download();
	predicted = argmaxRows(hostLogits, batch.n, k);

	for(b = 0; b < batch.n; b++)
	{
		if(!isfinite(hostLoss[b]))
		{
			throw EmgError("non-finite loss at batch entry " + to_string(b));
		}
		lossSum += hostLoss[b];
		if(predicted[b] == batch.targets[b])
		{
			correct++;
		}
	}

	return correct;
}

EpochMetrics Trainer::trainEpoch(BatchLoader &loader)
{
	EpochMetrics metrics;
	size_t batches = 0, i = 0, correct = 0;
	double lossSum = 0.0;

	net.setMode(NetMode::Train);

	batches = loader.startEpoch();
	for(i = 0; i < batches; i++)
	{
		Batch batch = loader.assemble(i);

		correct += runBatch(batch, true, lossSum);
		metrics.samples += batch.n;
	}

	if(metrics.samples == 0)
	{
		throw EmptyDatasetError("training pass produced no full batch of " + to_string(cfg.batchSize));
	}

	metrics.loss = lossSum / (double)metrics.samples;
	metrics.accuracy = (double)correct / (double)metrics.samples;

	return metrics;
}

EpochMetrics Trainer::evaluate(SampleStore &store)
{
	BatchLoader loader(store, cfg.batchSize, false, false, 0);
	EpochMetrics metrics;
	size_t batches = 0, i = 0, correct = 0;
	double lossSum = 0.0;

	net.setMode(NetMode::Eval);

	batches = loader.startEpoch();
	for(i = 0; i < batches; i++)
	{
		Batch batch = loader.assemble(i);

		correct += runBatch(batch, false, lossSum);
		metrics.samples += batch.n;
	}

	if(metrics.samples == 0)
	{
		throw EmptyDatasetError("evaluation pass over an empty store");
	}

	metrics.loss = lossSum / (double)metrics.samples;
	metrics.accuracy = (double)correct / (double)metrics.samples;

	return metrics;
}

double Trainer::fit(SampleStore &train, SampleStore &val)
{
	BatchLoader trainLoader(train, cfg.batchSize, true, true, cfg.seed);
	chrono::high_resolution_clock::time_point t1_host, t2_host;
	unsigned int epoch = 0;

	if(train.size() == 0 || val.size() == 0)
	{
		throw EmptyDatasetError("training needs non-empty train and validation stores");
	}
	if(val.augmenting())
	{
		cout << "Warning: validation store is augmenting, metrics will vary between passes" << endl;
	}

	// below any reachable accuracy, the first epoch always saves
	bestAccuracy = -1.0;
	checkpoints = 0;
	reports.clear();

	for(epoch = 1; epoch <= cfg.epochs; epoch++)
	{
		EpochReport report;

		t1_host = chrono::high_resolution_clock::now();
		report.epoch = epoch;
		report.train = trainEpoch(trainLoader);
		report.val = evaluate(val);
		t2_host = chrono::high_resolution_clock::now();

		if(cfg.verbose)
		{
			cout << fixed << setprecision(4);
			cout << "Epoch [" << epoch << "/" << cfg.epochs << "] "
			     << "Train Loss: " << report.train.loss << ", Train Acc: " << report.train.accuracy << " | "
			     << "Val Loss: " << report.val.loss << ", Val Acc: " << report.val.accuracy << endl;
		}

		if(report.val.accuracy > bestAccuracy)
		{
			bestAccuracy = report.val.accuracy;
			saveCheckpoint(cfg.checkpointPath, net);
			checkpoints++;
			report.saved = true;

			if(cfg.verbose)
			{
				cout << "\tNew best model saved to " << cfg.checkpointPath << " (Val Acc: " << bestAccuracy << ")" << endl;
			}
		}
		report.bestAccuracy = bestAccuracy;
		reports.push_back(report);

		if(cfg.verbose)
		{
			cout << "\tEpoch execution time: " << chrono::duration<double>(t2_host - t1_host).count() << " seconds" << endl;
		}
	}

	if(cfg.verbose)
	{
		cout << "Best validation accuracy: " << fixed << setprecision(4) << bestAccuracy << endl;
	}

	return bestAccuracy;
}
