#ifndef BIDIRECTIONAL_CHANNEL_H
#define BIDIRECTIONAL_CHANNEL_H

#include "bidirectional_channel/channel.h"
#include "bidirectional_channel/serve.h"

#endif // BIDIRECTIONAL_CHANNEL_H
