#ifndef CHECKPOINT_H
#define CHECKPOINT_H

#include "host_common.hpp"
#include "SpeechNet.hpp"

// header "emgspeech-checkpoint,<classes>,<entries>" then one "name,count,values..." line per entry
#define CKPT_MAGIC "emgspeech-checkpoint"

// full network state (parameters and running statistics), written via a temporary file
void saveCheckpoint(const string &path, SpeechNet &net);

// throws CheckpointError when the file does not match the network
void loadCheckpoint(const string &path, SpeechNet &net);

#endif /* CHECKPOINT_H */
