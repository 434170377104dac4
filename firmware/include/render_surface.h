/**
 * InkDeck - Render Surface
 * The panel as seen by the UI: a frame canvas plus show/clear/sleep
 */

#ifndef RENDER_SURFACE_H
#define RENDER_SURFACE_H

#include "canvas.h"

class RenderSurface {
public:
    virtual ~RenderSurface() {}

    // Frame the next show() pushes; screens redraw it completely per draw
    virtual Canvas& canvas() = 0;

    // Push the frame: partial (fast, may ghost) or full refresh.
    // Failures are logged and absorbed.
    virtual void show(bool partial) = 0;

    // Blank the panel
    virtual void clear() = 0;

    // Low-power state; the next show() wakes the panel
    virtual void sleep() = 0;

    // False when frames go to the preview file instead of a panel
    virtual bool hasPanel() const = 0;
};

#endif // RENDER_SURFACE_H
