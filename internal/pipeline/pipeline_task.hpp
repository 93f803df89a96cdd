#pragma once

#include "internal/model/channel_settings.hpp"

namespace airtime::pipeline {

/*
  One scheduled run of a channel's pipeline.
*/
struct ChannelRunTask {
  model::ChannelSettings channel;
};

}
